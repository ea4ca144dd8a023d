#ifndef UNION_FIND_H
#define UNION_FIND_H

#include <cstddef>
#include <map>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

// root id -> member ids in ascending order
typedef std::map<int, std::vector<int>> ClusterMap;

// Disjoint sets over ids [0, n) with union by rank and path compression.
class UnionFind {
private:
    std::vector<int> parent;
    std::vector<int> rank_;
    std::size_t numSets;

    void checkId(int x) const {
        if (x < 0 || static_cast<std::size_t>(x) >= parent.size())
            throw std::out_of_range("UnionFind: id " + std::to_string(x) +
                                    " outside universe of " + std::to_string(parent.size()));
    }

public:
    explicit UnionFind(std::size_t n) : parent(n), rank_(n, 0), numSets(n) {
        std::iota(parent.begin(), parent.end(), 0);
    }

    int find(int x) {
        checkId(x);
        if (parent[x] != x) {
            parent[x] = find(parent[x]);
        }
        return parent[x];
    }

    void unite(int x, int y) {
        int px = find(x);
        int py = find(y);
        if (px == py) return;

        if (rank_[px] < rank_[py]) {
            parent[px] = py;
        } else if (rank_[px] > rank_[py]) {
            parent[py] = px;
        } else {
            parent[py] = px;
            rank_[px]++;
        }
        numSets--;
    }

    bool connected(int x, int y) {
        return find(x) == find(y);
    }

    std::size_t size() const { return parent.size(); }

    // number of disjoint sets
    std::size_t count() const { return numSets; }

    ClusterMap listUnions() {
        ClusterMap unions;
        for (int i = 0; i < static_cast<int>(parent.size()); i++) {
            unions[find(i)].push_back(i);
        }
        return unions;
    }
};

#endif // UNION_FIND_H
