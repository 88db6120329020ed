
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

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include <atomic>
#include <mutex>
#include <optional>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <plf/plf_nanotimer.h>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <tree_ds/tree_ds.hpp>

namespace ThreadID {
// Creates a new ID.
[[nodiscard]] inline int next ( ) noexcept {
    static std::atomic<int> id = 0;
    return id++;
}
// Returns ID of this thread.
[[nodiscard]] inline int get ( ) noexcept {
    static thread_local int tl_id = next ( );
    return tl_id;
}
} // namespace ThreadID

namespace Rng {
[[nodiscard]] inline std::mt19937_64 & generator ( ) noexcept {
    static thread_local std::mt19937_64 generator ( 0x5EED + ThreadID::get ( ) );
    return generator;
}
} // namespace Rng

using Portfolio      = tree_ds::tree<std::string, int>;
using PortfolioNode  = tree_ds::node<std::string, int>;
using SequentialTree = tree_ds::tree<std::uint32_t, std::uint32_t>;
using ConcurrentTree = tree_ds::concurrent_tree<std::uint32_t, std::uint32_t>;

void portfolio ( ) {
    Portfolio tree{ "Portfolio" };
    std::string const root  = tree.add_node ( PortfolioNode{ "Risk", 5000 } );
    std::string const fixed = tree.add_node ( PortfolioNode{ "Fixed Income", 2000 }, root );
    std::string const eq    = tree.add_node ( PortfolioNode{ "Equity", 3000 }, root );
    std::string const debt  = tree.add_node ( PortfolioNode{ "Debt", 1000 }, fixed );
    std::string const funds = tree.add_node ( PortfolioNode{ "Mutual Funds", 1000 }, eq );
    std::string const stock = tree.add_node ( PortfolioNode{ "Stocks", 2000 }, eq );
    tree.add_node ( PortfolioNode{ "Debt Mutual Funds", 500 }, debt );
    tree.add_node ( PortfolioNode{ "Equity Mutual Funds", 500 }, funds );
    tree.add_node ( PortfolioNode{ "Large Cap Stocks", 1000 }, stock );
    tree.add_node ( PortfolioNode{ "Mid Cap Stocks", 1000 }, stock );
    tree.add_node ( PortfolioNode{ "Small Cap Stocks", 1000 }, stock );
    std::cout << tree << '\n';

    tree.remove_node ( stock, tree_ds::removal_strategy::remove_node_and_children );
    tree.rename ( std::string{ "After Removing The Stocks Node" } );
    std::cout << tree << '\n';

    std::cout << tree.get_subtree ( eq ) << '\n';
    std::cout << tree_ds::to_json ( tree, tree_ds::record_form::compact ) << "\n\n";
}

void auto_id ( ) {
    using Tree = tree_ds::tree<tree_ds::automated_id, std::string>;
    using Node = tree_ds::node<tree_ds::automated_id, std::string>;
    Tree tree{ "Sample Tree" };
    tree_ds::automated_id const ceo = tree.add_node ( Node::with_auto_id ( std::string{ "CEO" } ) );
    for ( char const * title : { "COO", "CTO", "CFO", "CIO" } )
        tree.add_node ( Node::with_auto_id ( std::string{ title } ), ceo );
    std::cout << tree << '\n';
}

// Attaches every new node below a random node of the first n_ nodes.
template<typename Tree>
void grow ( Tree & tree_, std::uint32_t n_ ) {
    using Node = typename Tree::node_type;
    tree_.add_node ( Node{ 0, 0 } );
    for ( std::uint32_t i = 1; i < n_; ++i )
        tree_.add_node ( Node{ i, i }, std::uniform_int_distribution<std::uint32_t> ( 0, i - 1 ) ( Rng::generator ( ) ) );
}

void sequential_benchmark ( std::uint32_t n_ ) {
    std::cout << "sequential tree" << '\n';
    SequentialTree tree;
    plf::nanotimer timer;
    timer.start ( );
    grow ( tree, n_ );
    std::uint64_t duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << duration << "ms " << tree.get_nodes ( ).size ( ) << '\n';
    for ( tree_ds::traversal_strategy strategy :
          { tree_ds::traversal_strategy::pre_order, tree_ds::traversal_strategy::post_order, tree_ds::traversal_strategy::in_order } ) {
        timer.start ( );
        std::size_t const visited = tree.traverse ( 0, strategy ).size ( );
        duration                  = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
        std::cout << duration << "ms " << visited << '\n';
    }
    timer.start ( );
    std::size_t const height = tree.get_height ( );
    duration                 = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << duration << "ms " << height << '\n';
}

// Threads bump the values of shared node handles, the tree lock serializes growth.
void concurrent_benchmark ( std::uint32_t n_, int threads_ ) {
    std::cout << "concurrent tree" << '\n';
    ConcurrentTree tree;
    grow ( tree, n_ );
    std::vector<ConcurrentTree::node_type> const handles ( tree.get_nodes ( ).begin ( ), tree.get_nodes ( ).end ( ) );
    std::vector<std::thread> threads;
    threads.reserve ( static_cast<std::size_t> ( threads_ ) );
    plf::nanotimer timer;
    timer.start ( );
    for ( int t = 0; t < threads_; ++t )
        threads.emplace_back ( [ &tree, &handles, n_ ] {
            for ( ConcurrentTree::node_type const & node : handles )
                node.update_value ( [ ] ( std::optional<std::uint32_t> & value_ ) { *value_ += 1; } );
            std::lock_guard<ConcurrentTree> lock ( tree );
            std::uint32_t const id = n_ + static_cast<std::uint32_t> ( ThreadID::get ( ) );
            tree.add_node ( ConcurrentTree::node_type{ id, id }, 0 );
        } );
    for ( std::thread & t : threads )
        t.join ( );
    std::uint64_t const duration = static_cast<std::uint64_t> ( timer.get_elapsed_ms ( ) );
    std::cout << duration << "ms " << tree.get_nodes ( ).size ( ) << ' ' << *tree.get_root_node ( )->value ( ) << '\n';
}

int main ( ) {
    spdlog::cfg::load_env_levels ( );
    try {
        portfolio ( );
        auto_id ( );
        sequential_benchmark ( 4'001 );
        concurrent_benchmark ( 4'001, 4 );
    }
    catch ( tree_ds::tree_error const & e ) {
        tree_ds::logger ( )->error ( "{}", e.what ( ) );
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
