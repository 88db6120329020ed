
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

#include <stdexcept>
#include <string>
#include <utility>

namespace tree_ds {

struct tree_error : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// add_node ( n, none ) while the tree already has a root.
struct root_node_already_present final : public tree_error {
    root_node_already_present ( ) :
        tree_error{ "Root node already present in the tree. You cannot add another root node." } {}
};

struct node_not_found final : public tree_error {
    explicit node_not_found ( std::string node_id_ ) :
        tree_error{ "Node " + node_id_ + " not found in the tree." }, m_node_id{ std::move ( node_id_ ) } {}

    [[nodiscard]] std::string const & node_id ( ) const noexcept { return m_node_id; }

    private:
    std::string m_node_id;
};

// Structurally illegal requests, the message carries the reason.
struct invalid_operation final : public tree_error {
    using tree_error::tree_error;
};

struct format_error final : public tree_error {
    using tree_error::tree_error;
};

// A record was accessed while the same thread holds it exclusively.
struct access_conflict final : public tree_error {
    using tree_error::tree_error;
};

} // namespace tree_ds
