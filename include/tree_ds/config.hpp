
// MIT License
//
// Copyright (c) 2020 degski
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

// Node output prints "id: value" when true, just "value" otherwise.
#ifndef TREE_DS_PRINT_NODE_ID
#    define TREE_DS_PRINT_NODE_ID true
#endif

#ifndef TREE_DS_LOGGER_NAME
#    define TREE_DS_LOGGER_NAME "tree_ds"
#endif

#include <deque>
#include <utility>
#include <vector>

#if not( ( defined( __clang__ ) or defined( __GNUC__ ) ) and not defined( _MSC_VER ) )
#    include <boost/container/deque.hpp>
#endif

#include <tbb/tbb_allocator.h>

namespace tree_ds {
namespace detail {

// Work stacks and queues of the explicit-stack algorithms.
template<typename Q>
using id_stack = std::vector<Q, tbb::tbb_allocator<Q>>;

#if ( defined( __clang__ ) or defined( __GNUC__ ) ) and not defined( _MSC_VER )
template<typename Q>
using id_queue = std::deque<Q, tbb::tbb_allocator<Q>>;
#else
template<typename Q>
using id_queue = boost::container::deque<Q, tbb::tbb_allocator<Q>>;
#endif

// Pop stack.
template<typename Q>
[[nodiscard]] Q pop ( id_stack<Q> & stack_ ) {
    Q v = std::move ( stack_.back ( ) );
    stack_.pop_back ( );
    return v;
}

// De-queue.
template<typename Q>
[[nodiscard]] Q de ( id_queue<Q> & queue_ ) {
    Q v = std::move ( queue_.front ( ) );
    queue_.pop_front ( );
    return v;
}

} // namespace detail
} // namespace tree_ds
