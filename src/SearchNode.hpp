#ifndef SEARCH_NODE_HPP
#define SEARCH_NODE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <queue>
#include <utility>
#include <vector>

#include "Board.hpp"
#include "MoveGenerator.hpp"

// A node of the A* search tree
struct SearchNode {
    Board board;   // board reached by this node
    int g_cost;    // moves from the start
    int h_cost;    // heuristic estimate to the goal
    int f_cost;    // g_cost + h_cost
    std::optional<Move> move; // move that produced board from parent->board; empty for the start node
    std::shared_ptr<const SearchNode> parent; // null for the start node

    SearchNode(const Board& b, int g, int h, std::optional<Move> m, std::shared_ptr<const SearchNode> p)
        : board(b), g_cost(g), h_cost(h), f_cost(g + h), move(m), parent(std::move(p)) {}
};

using SearchNodePtr = std::shared_ptr<const SearchNode>;

// Open list ordered by f_cost. Entries with equal f_cost pop in insertion order (FIFO),
// which makes the returned path reproducible for a fixed neighbor order.
class Frontier {
public:
    void push(SearchNodePtr node) {
        Entry entry{node->f_cost, next_sequence_++, std::move(node)};
        heap_.push(std::move(entry));
    }

    // Removes and returns the node with the smallest (f_cost, insertion sequence)
    SearchNodePtr pop() {
        SearchNodePtr node = heap_.top().node;
        heap_.pop();
        return node;
    }

    bool empty() const { return heap_.empty(); }
    std::size_t size() const { return heap_.size(); }

private:
    struct Entry {
        int f_cost;
        std::uint64_t sequence;
        SearchNodePtr node;
    };

    // std::priority_queue is a max-heap; "greater" puts the smallest key on top
    struct CompareEntry {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.f_cost != b.f_cost) {
                return a.f_cost > b.f_cost;
            }
            return a.sequence > b.sequence;
        }
    };

    std::priority_queue<Entry, std::vector<Entry>, CompareEntry> heap_;
    std::uint64_t next_sequence_ = 0;
};

#endif // SEARCH_NODE_HPP
