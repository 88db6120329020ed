
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

#include <atomic>
#include <thread>
#include <type_traits>

#include <tbb/spin_rw_mutex.h>

#include "../error.hpp"

namespace tree_ds {
namespace detail {

// Guards the record of a sequential node. Shared borrows nest, an exclusive borrow excludes
// everything. A conflicting borrow throws rather than blocks: on a single thread it can only be
// a re-entrant access.
struct borrow_flag final {
    borrow_flag ( ) noexcept                = default;
    borrow_flag ( borrow_flag const & )     = delete;
    borrow_flag ( borrow_flag && ) noexcept = delete;

    borrow_flag & operator= ( borrow_flag const & ) = delete;
    borrow_flag & operator= ( borrow_flag && ) noexcept = delete;

    void lock_shared ( ) {
        if ( exclusive == state )
            throw access_conflict{ "node is already borrowed exclusively" };
        ++state;
    }
    void unlock_shared ( ) noexcept { --state; }

    void lock ( ) {
        if ( state )
            throw access_conflict{ "node is already borrowed" };
        state = exclusive;
    }
    void unlock ( ) noexcept { state = 0; }

    private:
    static constexpr int exclusive = -1;

    int state = 0; // > 0: number of shared borrows.
};

// Guards the record of a concurrent node. Other threads block on the spin lock, the thread
// holding the write lock gets an access_conflict instead of a dead-lock.
struct checked_rw_mutex final {
    checked_rw_mutex ( ) noexcept                     = default;
    checked_rw_mutex ( checked_rw_mutex const & )     = delete;
    checked_rw_mutex ( checked_rw_mutex && ) noexcept = delete;

    checked_rw_mutex & operator= ( checked_rw_mutex const & ) = delete;
    checked_rw_mutex & operator= ( checked_rw_mutex && ) noexcept = delete;

    void lock_shared ( ) {
        check_owner ( );
        mutex.lock_shared ( );
    }
    void unlock_shared ( ) noexcept { mutex.unlock_shared ( ); }

    void lock ( ) {
        check_owner ( );
        mutex.lock ( );
        writer.store ( std::this_thread::get_id ( ), std::memory_order_relaxed );
    }
    void unlock ( ) noexcept {
        writer.store ( std::thread::id{ }, std::memory_order_relaxed );
        mutex.unlock ( );
    }

    private:
    void check_owner ( ) const {
        if ( writer.load ( std::memory_order_relaxed ) == std::this_thread::get_id ( ) )
            throw access_conflict{ "node is already locked exclusively by this thread" };
    }

    tbb::spin_rw_mutex mutex;
    std::atomic<std::thread::id> writer{ };
};

template<bool Concurrent>
using cell = std::conditional_t<Concurrent, checked_rw_mutex, borrow_flag>;

} // namespace detail
} // namespace tree_ds
