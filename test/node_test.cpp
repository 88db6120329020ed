
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
#include <functional>
#include <optional>
#include <sstream>
#include <vector>

#include <gtest/gtest.h>

#include <tree_ds/node.hpp>

namespace {

using node_t            = tree_ds::node<std::uint32_t, std::uint32_t>;
using concurrent_node_t = tree_ds::concurrent_node<std::uint32_t, std::uint32_t>;
using ids               = std::vector<std::uint32_t>;

TEST ( node, starts_unlinked ) {
    node_t const node{ 1, 2 };
    EXPECT_EQ ( node.id ( ), 1u );
    EXPECT_EQ ( node.value ( ), std::optional<std::uint32_t>{ 2 } );
    EXPECT_TRUE ( node.children_ids ( ).empty ( ) );
    EXPECT_FALSE ( node.parent_id ( ).has_value ( ) );
}

TEST ( node, without_value ) {
    node_t const node{ 7 };
    EXPECT_FALSE ( node.value ( ).has_value ( ) );
}

TEST ( node, add_child_links_both_ways ) {
    node_t const parent{ 1, 2 }, child{ 2, 3 };
    parent.add_child ( child );
    EXPECT_EQ ( parent.children_ids ( ), ids{ 2 } );
    EXPECT_EQ ( child.parent_id ( ), std::optional<std::uint32_t>{ 1 } );
}

TEST ( node, add_child_keeps_insertion_order ) {
    node_t const parent{ 1 };
    for ( std::uint32_t id : { 4u, 2u, 3u } )
        parent.add_child ( node_t{ id } );
    EXPECT_EQ ( parent.children_ids ( ), ( ids{ 4, 2, 3 } ) );
}

TEST ( node, add_self_as_child_throws ) {
    node_t const node{ 1 };
    EXPECT_THROW ( node.add_child ( node ), tree_ds::access_conflict );
    EXPECT_TRUE ( node.children_ids ( ).empty ( ) );
}

TEST ( node, remove_child_removes_every_occurrence ) {
    node_t const parent{ 1 }, child{ 2 }, other{ 3 };
    parent.add_child ( child );
    parent.add_child ( other );
    parent.add_child ( child );
    parent.remove_child ( child );
    EXPECT_EQ ( parent.children_ids ( ), ids{ 3 } );
    EXPECT_FALSE ( child.parent_id ( ).has_value ( ) );
    EXPECT_EQ ( other.parent_id ( ), std::optional<std::uint32_t>{ 1 } );
}

TEST ( node, copies_share_the_record ) {
    node_t const node{ 1, 2 };
    node_t const copy = node;
    copy.set_value ( 5 );
    EXPECT_EQ ( node.value ( ), std::optional<std::uint32_t>{ 5 } );
    EXPECT_TRUE ( copy.shares_record_with ( node ) );
}

TEST ( node, duplicate_is_independent ) {
    node_t const node{ 1, 2 };
    node.add_child ( node_t{ 3 } );
    node_t const copy = node.duplicate ( );
    EXPECT_FALSE ( copy.shares_record_with ( node ) );
    EXPECT_EQ ( copy.children_ids ( ), ids{ 3 } );
    copy.set_value ( std::nullopt );
    EXPECT_EQ ( node.value ( ), std::optional<std::uint32_t>{ 2 } );
}

TEST ( node, set_parent ) {
    node_t const parent{ 1 }, child{ 2 };
    child.set_parent ( parent );
    EXPECT_EQ ( child.parent_id ( ), std::optional<std::uint32_t>{ 1 } );
    EXPECT_EQ ( parent.children_ids ( ), ids{ 2 } );
    child.set_parent ( std::nullopt );
    EXPECT_FALSE ( child.parent_id ( ).has_value ( ) );
}

TEST ( node, update_value ) {
    node_t const node{ 1, 2 };
    node.update_value ( [ ] ( std::optional<std::uint32_t> & value_ ) { *value_ *= 21; } );
    EXPECT_EQ ( node.value ( ), std::optional<std::uint32_t>{ 42 } );
    node.update_value ( [ ] ( std::optional<std::uint32_t> & value_ ) { value_.reset ( ); } );
    EXPECT_FALSE ( node.value ( ).has_value ( ) );
}

TEST ( node, access_from_update_value_throws ) {
    node_t const node{ 1, 2 };
    EXPECT_THROW ( node.update_value ( [ &node ] ( std::optional<std::uint32_t> & ) { (void) node.value ( ); } ),
                   tree_ds::access_conflict );
    // The borrow is released by the throw.
    EXPECT_EQ ( node.value ( ), std::optional<std::uint32_t>{ 2 } );
    node.set_value ( 3 );
    EXPECT_EQ ( node.value ( ), std::optional<std::uint32_t>{ 3 } );
}

TEST ( node, concurrent_access_from_update_value_throws ) {
    concurrent_node_t const node{ 1, 2 };
    EXPECT_THROW ( node.update_value ( [ &node ] ( std::optional<std::uint32_t> & ) { node.set_value ( 4 ); } ),
                   tree_ds::access_conflict );
    EXPECT_EQ ( node.value ( ), std::optional<std::uint32_t>{ 2 } );
}

TEST ( node, sort_children ) {
    node_t const parent{ 1 };
    for ( std::uint32_t id : { 3u, 5u, 4u, 2u } )
        parent.add_child ( node_t{ id } );
    parent.sort_children ( std::greater<std::uint32_t>{ } );
    EXPECT_EQ ( parent.children_ids ( ), ( ids{ 5, 4, 3, 2 } ) );
    // The comparator may read the node being sorted.
    parent.sort_children ( [ &parent ] ( std::uint32_t a_, std::uint32_t b_ ) { return not parent.value ( ) and a_ < b_; } );
    EXPECT_EQ ( parent.children_ids ( ), ( ids{ 2, 3, 4, 5 } ) );
}

TEST ( node, equality_compares_id_and_value ) {
    node_t const a{ 1, 2 }, b{ 1, 2 }, c{ 1, 3 }, d{ 2, 2 };
    a.add_child ( node_t{ 9 } );
    EXPECT_EQ ( a, b );
    EXPECT_NE ( a, c );
    EXPECT_NE ( a, d );
}

TEST ( node, hash_covers_links ) {
    node_t const a{ 1, 2 }, b{ 1, 2 };
    std::hash<node_t> const hash{ };
    EXPECT_EQ ( hash ( a ), hash ( b ) );
    a.add_child ( node_t{ 3 } );
    EXPECT_NE ( hash ( a ), hash ( b ) );
}

TEST ( node, stream_output ) {
    std::ostringstream out;
    out << node_t{ 1, 2 } << ' ' << node_t{ 3 };
    EXPECT_EQ ( out.str ( ), "1: 2 3: 0" );
}

TEST ( node, with_auto_id ) {
    tree_ds::sequential_id_generator generator{ 10 };
    node_t const a = node_t::with_auto_id ( 1, generator );
    node_t const b = node_t::with_auto_id ( std::nullopt, generator );
    EXPECT_EQ ( a.id ( ), 10u );
    EXPECT_EQ ( b.id ( ), 11u );
    EXPECT_EQ ( a.value ( ), std::optional<std::uint32_t>{ 1 } );
    EXPECT_FALSE ( b.value ( ).has_value ( ) );
}

} // namespace
