
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
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

#include "error.hpp"

namespace tree_ds {

// The id type of nodes created with an automated id.
using automated_id = std::uint64_t;

// Supplies process-unique, strictly increasing raw ids.
struct id_generator {
    virtual ~id_generator ( ) = default;

    [[nodiscard]] virtual automated_id next ( ) = 0;
};

// A counter, starting at start_.
struct sequential_id_generator final : public id_generator {

    explicit sequential_id_generator ( automated_id start_ = 1 ) noexcept : m_next{ start_ } {}

    [[nodiscard]] automated_id next ( ) noexcept override { return m_next.fetch_add ( 1, std::memory_order_relaxed ); }

    private:
    std::atomic<automated_id> m_next;
};

// Microseconds since the epoch, bumped by one where the clock has not advanced (or went back),
// so that ids stay unique across runs as well as within one.
struct epoch_id_generator final : public id_generator {

    [[nodiscard]] automated_id next ( ) noexcept override {
        automated_id const now = static_cast<automated_id> (
            std::chrono::duration_cast<std::chrono::microseconds> ( std::chrono::system_clock::now ( ).time_since_epoch ( ) )
                .count ( ) );
        automated_id last = m_last.load ( std::memory_order_relaxed );
        automated_id id;
        do {
            id = now > last ? now : last + 1;
        } while ( not m_last.compare_exchange_weak ( last, id, std::memory_order_relaxed ) );
        return id;
    }

    private:
    std::atomic<automated_id> m_last{ 0 };
};

// The generator used by with_auto_id ( ) when none is given.
[[nodiscard]] inline id_generator & default_id_generator ( ) noexcept {
    static epoch_id_generator generator;
    return generator;
}

// Converts a raw generated id into the id type Q.
template<typename Q, typename = void>
struct id_from {
    [[nodiscard]] Q operator( ) ( automated_id raw_ ) const { return Q{ raw_ }; }
};

// Throws invalid_operation where raw_ does not fit Q exactly.
template<typename Q>
struct id_from<Q, std::enable_if_t<std::is_arithmetic<Q>::value>> {
    [[nodiscard]] Q operator( ) ( automated_id raw_ ) const {
        if constexpr ( std::is_integral<Q>::value ) {
            if ( raw_ > static_cast<std::uintmax_t> ( std::numeric_limits<Q>::max ( ) ) )
                throw invalid_operation{ "Generated id " + std::to_string ( raw_ ) + " does not fit the id type." };
        }
        else if constexpr ( std::numeric_limits<Q>::digits < std::numeric_limits<automated_id>::digits ) {
            if ( raw_ > ( automated_id{ 1 } << std::numeric_limits<Q>::digits ) )
                throw invalid_operation{ "Generated id " + std::to_string ( raw_ ) + " does not fit the id type." };
        }
        return static_cast<Q> ( raw_ );
    }
};

template<>
struct id_from<std::string> {
    [[nodiscard]] std::string operator( ) ( automated_id raw_ ) const { return std::to_string ( raw_ ); }
};

} // namespace tree_ds
