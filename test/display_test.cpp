
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

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <tree_ds/tree.hpp>

namespace {

using node_t  = tree_ds::node<std::uint32_t, std::uint32_t>;
using nodes_t = tree_ds::nodes<std::uint32_t, std::uint32_t>;
using tree_t  = tree_ds::tree<std::uint32_t, std::uint32_t>;
using ids     = std::vector<std::uint32_t>;

TEST ( display, named_tree ) {
    tree_t tree{ "Sample Tree" };
    tree.add_node ( node_t{ 1, 2 } );
    tree.add_node ( node_t{ 2, 3 }, 1 );
    tree.add_node ( node_t{ 3, 6 }, 2 );
    tree.add_node ( node_t{ 4, 5 }, 2 );
    EXPECT_EQ ( tree.to_string ( ), "Sample Tree\n***********\n1: 2\n└── 2: 3\n    ├── 3: 6\n    └── 4: 5\n" );
    std::ostringstream out;
    out << tree;
    EXPECT_EQ ( out.str ( ), tree.to_string ( ) );
}

TEST ( display, unnamed_tree_with_siblings ) {
    tree_t tree;
    tree.add_node ( node_t{ 1 } );
    tree.add_node ( node_t{ 2, 2 }, 1 );
    tree.add_node ( node_t{ 3, 3 }, 1 );
    tree.add_node ( node_t{ 4, 4 }, 2 );
    tree.add_node ( node_t{ 5, 5 }, 3 );
    EXPECT_EQ ( tree.to_string ( ), "1: 0\n├── 2: 2\n│   └── 4: 4\n└── 3: 3\n    └── 5: 5\n" );
}

TEST ( display, underline_counts_characters ) {
    tree_t tree{ "Bäume" };
    tree.add_node ( node_t{ 1, 1 } );
    EXPECT_EQ ( tree.to_string ( ), "Bäume\n*****\n1: 1\n" );
}

TEST ( display, without_root ) {
    tree_t const empty;
    EXPECT_THROW ( (void) empty.to_string ( ), tree_ds::format_error );
    tree_t const rootless{ std::nullopt, nodes_t{ node_t{ 1, 0, ids{ }, 2 } } };
    EXPECT_THROW ( (void) rootless.to_string ( ), tree_ds::format_error );
}

TEST ( display, unknown_child ) {
    tree_t tree;
    tree.add_node ( node_t{ 1 } );
    tree.get_root_node ( )->add_child ( node_t{ 7 } );
    EXPECT_THROW ( (void) tree.to_string ( ), tree_ds::format_error );
}

} // namespace
