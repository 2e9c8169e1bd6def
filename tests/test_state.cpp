#include <catch2/catch.hpp>
#include "state.hpp"

using namespace prisma;

static Channel chan(int64_t id, int position) {
    Channel c;
    c.id = id;
    c.name = "c" + std::to_string(id);
    c.position = position;
    return c;
}

TEST_CASE("flatten_channels: sorts by channel position across categories", "[state]") {
    ChannelCategory first;
    first.position = 1;
    first.channels = {chan(1, 2), chan(2, 1)}; // A(2), B(1)
    ChannelCategory second;
    second.position = 0;
    second.channels = {chan(3, 0)};            // C(0)

    auto flat = flatten_channels({first, second});
    REQUIRE(flat.size() == 3);
    REQUIRE(flat[0].id == 3);
    REQUIRE(flat[1].id == 2);
    REQUIRE(flat[2].id == 1);
}

TEST_CASE("flatten_channels: ties keep server order", "[state]") {
    ChannelCategory a;
    a.channels = {chan(5, 0), chan(6, 0)};
    ChannelCategory b;
    b.channels = {chan(7, 0)};

    auto flat = flatten_channels({a, b});
    REQUIRE(flat[0].id == 5);
    REQUIRE(flat[1].id == 6);
    REQUIRE(flat[2].id == 7);
}

TEST_CASE("flatten_channels: no categories yields no channels", "[state]") {
    REQUIRE(flatten_channels({}).empty());
    REQUIRE(flatten_channels({ChannelCategory{}}).empty());
}

TEST_CASE("SessionState: active_channel follows the index", "[state]") {
    SessionState s;
    REQUIRE(s.active_channel() == nullptr);

    s.channels = {chan(1, 0), chan(2, 1)};
    s.active_channel_index = 1;
    REQUIRE(s.active_channel() != nullptr);
    REQUIRE(s.active_channel()->id == 2);
}

TEST_CASE("SessionState: messages_for reports missing buffers", "[state]") {
    SessionState s;
    REQUIRE(s.messages_for(9) == nullptr);
    s.messages_by_channel[9];
    REQUIRE(s.messages_for(9) != nullptr);
    REQUIRE(s.messages_for(9)->empty());
}
