#include "inbox.h"

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using namespace std::chrono_literals;

namespace {

DiscoveryResult MakeResult(std::string const& pid, Timestamp timestamp = Timestamp{}) {
    return DiscoveryResult{
        .uid = EntityUid{EntityKind::player, pid},
        .label = "Player " + pid,
        .properties = {{kPropName, "Player " + pid}, {kPropPid, pid}},
        .bridge_uid = "bridge-1",
        .timestamp = timestamp,
    };
}

struct Recorder {
    explicit Recorder(EventBus& bus) {
        bus.Subscribe<ResultAdded>([this](ResultAdded const& e) { log.push_back("result+" + e.result.uid.ToString()); });
        bus.Subscribe<ResultRemoved>([this](ResultRemoved const& e) { log.push_back("result-" + e.uid.ToString()); });
        bus.Subscribe<ThingAdded>([this](ThingAdded const& e) { log.push_back("thing+" + e.thing.uid.ToString()); });
        bus.Subscribe<ThingRemoved>([this](ThingRemoved const& e) { log.push_back("thing-" + e.uid.ToString()); });
        bus.Subscribe<ThingStatusChanged>([this](ThingStatusChanged const& e) {
            log.push_back(std::string(ToString(e.status)) + ":" + e.uid.ToString());
        });
    }

    std::vector<std::string> log;
};

} // namespace

TEST_CASE( "results wait for approval", "[inbox]" ) {
    EventBus bus;
    Recorder recorder(bus);
    DiscoveryInbox inbox(bus, false);

    inbox.EntityDiscovered(MakeResult("1"));
    bus.ProcessAll();

    REQUIRE(inbox.GetResults().size() == 1);
    REQUIRE(inbox.GetThings().empty());
    REQUIRE(recorder.log == std::vector<std::string>{"result+player:1"});

    REQUIRE(inbox.Approve(EntityUid{EntityKind::player, "1"}));
    REQUIRE_FALSE(inbox.Approve(EntityUid{EntityKind::player, "1"}));
    bus.ProcessAll();

    REQUIRE(inbox.GetResults().empty());
    auto thing = inbox.GetThing(EntityUid{EntityKind::player, "1"});
    REQUIRE(thing);
    REQUIRE(thing->label == "Player 1");
    REQUIRE(thing->bridge_uid == "bridge-1");
    REQUIRE(thing->properties.at(kPropPid) == "1");
    REQUIRE(thing->status == ThingStatus::online);
    REQUIRE(recorder.log.back() == "thing+player:1");
}

TEST_CASE( "auto approve adopts results at once", "[inbox]" ) {
    EventBus bus;
    Recorder recorder(bus);
    DiscoveryInbox inbox(bus, true);

    inbox.EntityDiscovered(MakeResult("1"));
    bus.ProcessAll();

    REQUIRE(inbox.GetResults().empty());
    REQUIRE(inbox.GetThings().size() == 1);
    REQUIRE(recorder.log == std::vector<std::string>{"result+player:1", "thing+player:1"});

    // Known thing, result is ignored.
    inbox.EntityDiscovered(MakeResult("1"));
    bus.ProcessAll();
    REQUIRE(recorder.log.size() == 2);
}

TEST_CASE( "status changes apply to things only", "[inbox]" ) {
    EventBus bus;
    Recorder recorder(bus);
    DiscoveryInbox inbox(bus, true);
    EntityUid uid{EntityKind::player, "1"};

    inbox.SetEntityStatusOffline(uid);
    bus.ProcessAll();
    REQUIRE(recorder.log.empty());

    inbox.EntityDiscovered(MakeResult("1"));
    inbox.SetEntityStatusOnline(uid);
    inbox.SetEntityStatusOffline(uid);
    inbox.SetEntityStatusOffline(uid);
    bus.ProcessAll();

    REQUIRE(recorder.log == std::vector<std::string>{"result+player:1", "thing+player:1", "offline:player:1"});
    REQUIRE(inbox.GetThing(uid)->status == ThingStatus::offline);
}

TEST_CASE( "removed entity drops its pending result", "[inbox]" ) {
    EventBus bus;
    Recorder recorder(bus);
    DiscoveryInbox inbox(bus, false);

    inbox.EntityDiscovered(MakeResult("1"));
    inbox.EntityRemoved(EntityUid{EntityKind::player, "1"});
    inbox.EntityRemoved(EntityUid{EntityKind::player, "1"});
    bus.ProcessAll();

    REQUIRE(inbox.GetResults().empty());
    REQUIRE(recorder.log == std::vector<std::string>{"result+player:1", "result-player:1"});
}

TEST_CASE( "purge removes strictly older results", "[inbox]" ) {
    EventBus bus;
    Recorder recorder(bus);
    DiscoveryInbox inbox(bus, false);
    Timestamp base{};

    inbox.EntityDiscovered(MakeResult("1", base + 1s));
    inbox.EntityDiscovered(MakeResult("2", base + 2s));
    inbox.EntityDiscovered(MakeResult("3", base + 3s));

    inbox.PurgeResultsOlderThan(base + 2s);
    bus.ProcessAll();

    auto results = inbox.GetResults();
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].uid.id == "2");
    REQUIRE(results[1].uid.id == "3");
    REQUIRE(recorder.log.back() == "result-player:1");
}

TEST_CASE( "remove thing", "[inbox]" ) {
    EventBus bus;
    Recorder recorder(bus);
    DiscoveryInbox inbox(bus, true);
    EntityUid uid{EntityKind::player, "1"};

    inbox.EntityDiscovered(MakeResult("1"));
    REQUIRE(inbox.RemoveThing(uid));
    REQUIRE_FALSE(inbox.RemoveThing(uid));
    bus.ProcessAll();

    REQUIRE_FALSE(inbox.GetThing(uid));
    REQUIRE(recorder.log.back() == "thing-player:1");

    // Rediscovery is possible again.
    inbox.EntityDiscovered(MakeResult("1"));
    REQUIRE(inbox.GetThing(uid));
}
