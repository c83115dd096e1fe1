#include "row_queue.hpp"
#include "test_check.hpp"

#include <string>
#include <vector>

using namespace waterfall;

int main() {
    // Drop-oldest on overflow
    {
        RowQueue<std::string> q(3);
        CHECK(!q.push("a"));
        CHECK(!q.push("b"));
        CHECK(!q.push("c"));
        CHECK(q.full());
        CHECK(q.push("d"));
        CHECK(q.size() == 3);
        CHECK(q.dropped() == 1);

        std::vector<std::string> out;
        const auto n = q.drain([&](std::string&& s) { out.push_back(s); });
        CHECK(n == 3);
        CHECK((out == std::vector<std::string>{"b", "c", "d"}));
        CHECK(q.empty());
    }

    // Each entry delivered exactly once across pop and drain
    {
        RowQueue<int> q(4);
        for (int i = 0; i < 4; ++i) q.push(i);
        int first = -1;
        CHECK(q.pop(first));
        CHECK(first == 0);
        q.push(4);
        q.push(5); // evicts 1
        std::vector<int> out;
        q.drain([&](int v) { out.push_back(v); });
        CHECK((out == std::vector<int>{2, 3, 4, 5}));
        int none = 0;
        CHECK(!q.pop(none));
    }

    // Clear keeps the eviction count
    {
        RowQueue<int> q(1);
        q.push(1);
        q.push(2);
        q.clear();
        CHECK(q.empty());
        CHECK(q.dropped() == 1);
        CHECK(q.capacity() == 1);
    }

    // Zero capacity still holds one entry
    {
        RowQueue<int> q(0);
        CHECK(q.capacity() == 1);
    }

    return finish("row_queue_test");
}
