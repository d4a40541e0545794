// linkvec_bench report formatting tests

#include <catch2/catch_test_macros.hpp>
#include <linkvec/bench/report.hpp>
#include <chrono>
#include <cstdint>
#include <list>
#include <string>
#include <vector>

using namespace linkvec_bench;

TEST_CASE("human_bytes", "[bench][report]") {
    REQUIRE(human_bytes(0) == "0.00 B");
    REQUIRE(human_bytes(1023) == "1023.00 B");
    REQUIRE(human_bytes(1024) == "1.00 KB");
    REQUIRE(human_bytes(1536) == "1.50 KB");
    REQUIRE(human_bytes(1024 * 1024) == "1.00 MB");
    REQUIRE(human_bytes(std::size_t{5} * 1024 * 1024 * 1024) == "5.00 GB");
}

TEST_CASE("format_duration", "[bench][report]") {
    using namespace std::chrono_literals;
    REQUIRE(format_duration(512ns) == "512ns");
    REQUIRE(format_duration(1500ns) == "1.50us");
    REQUIRE(format_duration(2500us) == "2.50ms");
    REQUIRE(format_duration(3s) == "3.00s");
}

TEST_CASE("report_memory", "[bench][report]") {
    SECTION("vector uses element size") {
        std::vector<std::uint64_t> v(4, 0);
        MemoryReport r = report_memory(v);
        REQUIRE(r.container == "std::vector");
        REQUIRE(r.len == 4);
        REQUIRE(r.used == 32);
        REQUIRE(r.real == sizeof(std::uint64_t) * v.capacity());
        REQUIRE_FALSE(r.estimated);
    }

    SECTION("list counts two links per node") {
        std::list<std::uint64_t> l(3, 0);
        MemoryReport r = report_memory(l);
        REQUIRE(r.used == (sizeof(std::uint64_t) + 2 * sizeof(void*)) * 3);
        REQUIRE_FALSE(r.capacity.has_value());
        REQUIRE(r.estimated);
    }

    SECTION("indexed list reports slot accounting") {
        linkvec_structures::IndexedList<std::uint64_t> list;
        list.push_back(1);
        list.push_back(2);
        list.pop_front();

        MemoryReport r = report_memory(list);
        REQUIRE(r.container == "IndexedList");
        REQUIRE(r.len == 1);
        REQUIRE(r.true_len == std::optional<std::size_t>{2});
        REQUIRE(r.used == list.mem_used());
        REQUIRE(r.real == list.true_mem_used());
    }
}

TEST_CASE("format_report", "[bench][report]") {
    MemoryReport r;
    r.container = "IndexedList";
    r.len = 1;
    r.true_len = 3;
    r.capacity = 4;
    r.used = 2048;
    r.real = 4096;
    r.estimated = true;

    std::string text = format_report(r);
    REQUIRE(text == "IndexedList: len = 1, true_len = 3, capacity = 4\n"
                    "  used ~ 2048 (2.00 KB)\n"
                    "  real ~ 4096 (4.00 KB)");
}
