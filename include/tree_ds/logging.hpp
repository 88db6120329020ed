
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

#include <memory>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "config.hpp"

namespace tree_ds {

using logger_t = std::shared_ptr<spdlog::logger>;

// The library logger, created on first use. An application may register its own logger under
// TREE_DS_LOGGER_NAME before that to redirect the output.
[[nodiscard]] inline logger_t logger ( ) {
    static logger_t const instance = [ ] {
        logger_t result = spdlog::get ( TREE_DS_LOGGER_NAME );
        if ( not result ) {
            result = spdlog::stdout_color_mt ( TREE_DS_LOGGER_NAME );
            result->set_pattern ( "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v" );
        }
        return result;
    }( );
    return instance;
}

namespace detail {

// String form of an id (or any streamable value), used in messages and sub-tree names.
template<typename Q>
[[nodiscard]] std::string to_string ( Q const & id_ ) {
    std::ostringstream stream;
    stream << id_;
    return stream.str ( );
}

} // namespace detail
} // namespace tree_ds
