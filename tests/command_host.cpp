#include "../src/CommandHost.hpp"
#include "../src/Counter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <vector>


TEST_CASE("commands map to counter operations", "[host]") {
    Counter counter(std::make_shared<ManualClock>());
    CommandHost host(&counter);

    REQUIRE(host.execute("inc") == "ok 1");
    REQUIRE(host.execute("add 10") == "ok 11");
    REQUIRE(host.execute("dec") == "ok 10");
    REQUIRE(host.execute("sub 3") == "ok 7");
    REQUIRE(host.execute("set 2") == "ok 2");
    REQUIRE(host.execute("get") == "value 2");
    REQUIRE(host.execute("reset") == "ok 0");
    REQUIRE(counter.get() == 0);
}

TEST_CASE("verbs are case-insensitive and whitespace tolerant", "[host]") {
    Counter counter(std::make_shared<ManualClock>());
    CommandHost host(&counter);

    REQUIRE(host.execute("  ADD\t5  ") == "ok 5");
    REQUIRE(host.execute("Get") == "value 5");
}

TEST_CASE("bounds violations are reported", "[host]") {
    Counter counter(std::make_shared<ManualClock>());
    CommandHost host(&counter);

    REQUIRE(host.execute("dec") == "error underflow");
    REQUIRE(host.execute("sub 1") == "error underflow");
    REQUIRE(host.execute("set 18446744073709551615") == "ok 18446744073709551615");
    REQUIRE(host.execute("inc") == "error overflow");
    REQUIRE(host.execute("add 1") == "error overflow");
    REQUIRE(counter.get() == Counter::MAX);
}

TEST_CASE("malformed commands", "[host]") {
    Counter counter(std::make_shared<ManualClock>(), 4);
    std::vector<ChangeRecord> records{};
    QObject::connect(&counter, &Counter::changed, [&records](const ChangeRecord &record) {
        records.push_back(record);
    });
    CommandHost host(&counter);

    REQUIRE(host.execute("add") == "error add expects one unsigned integer");
    REQUIRE(host.execute("add x") == "error add expects one unsigned integer");
    REQUIRE(host.execute("sub -1") == "error sub expects one unsigned integer");
    REQUIRE(host.execute("set 1 2") == "error set expects one unsigned integer");
    REQUIRE(host.execute("add 18446744073709551616") == "error add expects one unsigned integer");
    REQUIRE(host.execute("inc 3") == "error inc takes no arguments");
    REQUIRE(host.execute("jump") == "error unknown command 'jump'");

    REQUIRE(counter.get() == 4);
    REQUIRE(records.empty());
}

TEST_CASE("blank lines and comments produce no reply", "[host]") {
    Counter counter(std::make_shared<ManualClock>());
    CommandHost host(&counter);

    REQUIRE(host.execute("").isEmpty());
    REQUIRE(host.execute("   ").isEmpty());
    REQUIRE(host.execute("# inc").isEmpty());
    REQUIRE(counter.get() == 0);
}

TEST_CASE("run stops at quit", "[host]") {
    Counter counter(std::make_shared<ManualClock>());
    CommandHost host(&counter);
    bool quit = false;
    QObject::connect(&host, &CommandHost::quitRequested, [&quit]() { quit = true; });

    QString input = "add 10\n"
                    "sub 3\n"
                    "\n"
                    "# overwrite\n"
                    "set 2\n"
                    "dec\n"
                    "dec\n"
                    "dec\n"
                    "get\n"
                    "quit\n"
                    "inc\n";
    QString output;
    QTextStream in(&input);
    QTextStream out(&output);

    host.run(in, out);

    REQUIRE(quit);
    REQUIRE(host.finished());
    REQUIRE(counter.get() == 0);
    REQUIRE(output == "ok 10\n"
                      "ok 7\n"
                      "ok 2\n"
                      "ok 1\n"
                      "ok 0\n"
                      "error underflow\n"
                      "value 0\n");
}

TEST_CASE("run stops at end of input", "[host]") {
    Counter counter(std::make_shared<ManualClock>());
    CommandHost host(&counter);

    QString input = "inc\ninc";
    QString output;
    QTextStream in(&input);
    QTextStream out(&output);

    host.run(in, out);

    REQUIRE_FALSE(host.finished());
    REQUIRE(output == "ok 1\nok 2\n");
}
