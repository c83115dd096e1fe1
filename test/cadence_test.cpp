#include "cadence.hpp"
#include "test_check.hpp"

using namespace waterfall;

int main() {
    // Due times stay on the 1/R grid despite late polls
    {
        CadenceScheduler c;
        c.start(0.0);
        CHECK(c.poll(0.0, 20.0));
        CHECK_NEAR(c.next_due(), 0.05, 1e-12);
        CHECK(!c.poll(0.0, 20.0));
        CHECK(!c.poll(0.040, 20.0));
        CHECK(c.poll(0.0513, 20.0));
        CHECK_NEAR(c.next_due(), 0.10, 1e-12);
        CHECK(c.poll(0.1167, 20.0));
        CHECK_NEAR(c.next_due(), 0.15, 1e-12);
        CHECK(c.fired() == 3);
    }

    // Early by less than the tolerance still fires
    {
        CadenceScheduler c;
        c.start(0.0);
        CHECK(c.poll(0.0, 20.0));
        CHECK(c.poll(0.0485, 20.0));
        CHECK(!c.poll(0.0970, 20.0));
        CHECK(c.poll(0.0985, 20.0));
    }

    // At most one firing per poll while catching up
    {
        CadenceScheduler c;
        c.start(0.0);
        CHECK(c.poll(0.0, 10.0));
        CHECK(c.poll(0.35, 10.0));
        CHECK_NEAR(c.next_due(), 0.2, 1e-12);
        CHECK(c.poll(0.35, 10.0));
        CHECK(c.poll(0.35, 10.0));
        CHECK(!c.poll(0.35, 10.0));
    }

    // Far behind: re-anchored at now
    {
        CadenceScheduler c;
        c.start(0.0);
        CHECK(c.poll(0.0, 20.0));
        CHECK(c.poll(5.0, 20.0));
        CHECK(c.resyncs() == 1);
        CHECK_NEAR(c.next_due(), 5.05, 1e-12);
    }

    // Stopped or zero rate never fires
    {
        CadenceScheduler c;
        CHECK(!c.poll(1.0, 20.0));
        c.start(0.0);
        CHECK(!c.poll(0.0, 0.0));
        c.stop();
        CHECK(!c.running());
        CHECK(!c.poll(10.0, 20.0));
    }

    // Rearm restarts the grid at now
    {
        CadenceScheduler c;
        c.start(0.0);
        CHECK(c.poll(0.0, 20.0));
        c.rearm(2.0);
        CHECK(!c.poll(1.9, 20.0));
        CHECK(c.poll(2.0, 20.0));
        CHECK(c.resyncs() == 0);
    }

    return finish("cadence_test");
}
