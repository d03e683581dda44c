/*
===============================================================================
 StateTracker unit tests
===============================================================================

Covers the derived call / device model:
- Newchannel creates a ringing CallRecord with direction and extension
- Newstate updates verbatim, Hangup removes, unknown uniqueids are no-ops
- DeviceStateChange / ExtensionStatus upsert device states
- queue events leave the model alone
- accessors hand out copies
===============================================================================
*/

#include <iostream>
#include <string>

#include "amilive/message.hpp"
#include "amilive/settings.hpp"
#include "amilive/state_tracker.hpp"
#include "common/test_check.hpp"

using amilive::CallDirection;
using amilive::MessageKind;
using amilive::ProtocolMessage;
using amilive::StateTracker;

static ProtocolMessage event(amilive::Headers h) {
  return ProtocolMessage(MessageKind::Event, std::move(h));
}

static ProtocolMessage newchannel(const std::string& uid, const std::string& channel,
                                  const std::string& context) {
  return event({{"Event", "Newchannel"},
                {"Uniqueid", uid},
                {"Channel", channel},
                {"CallerIDNum", "5551234"},
                {"Exten", "2000"},
                {"Context", context}});
}

void test_newchannel_example() {
  std::cout << "[TEST] Newchannel from-internal SIP/1001\n";
  StateTracker st{amilive::Settings{}};
  st.apply(newchannel("1700000000.1", "SIP/1001-00000001", "from-internal"));

  auto calls = st.active_calls();
  TEST_CHECK(calls.size() == 1);
  const auto& c = calls[0];
  TEST_CHECK(c.uniqueid == "1700000000.1");
  TEST_CHECK(c.channel == "SIP/1001-00000001");
  TEST_CHECK(c.caller_id == "5551234");
  TEST_CHECK(c.destination == "2000");
  TEST_CHECK(c.context == "from-internal");
  TEST_CHECK(c.extension == "1001");
  TEST_CHECK(c.direction == CallDirection::Outbound);
  TEST_CHECK(c.state == "ringing");
  std::cout << "[TEST] OK\n";
}

void test_hangup() {
  std::cout << "[TEST] Newchannel then Hangup, unknown Hangup\n";
  StateTracker st{amilive::Settings{}};
  st.apply(newchannel("U1", "PJSIP/2001-0000000a", "from-pstn"));
  st.apply(event({{"Event", "Hangup"}, {"Uniqueid", "U1"}, {"Cause", "16"}}));
  TEST_CHECK(st.active_calls().empty());

  st.apply(newchannel("U2", "PJSIP/2001-0000000b", "from-pstn"));
  st.apply(event({{"Event", "Hangup"}, {"Uniqueid", "nope"}}));
  st.apply(event({{"Event", "Hangup"}}));
  auto calls = st.active_calls();
  TEST_CHECK(calls.size() == 1);
  TEST_CHECK(calls[0].uniqueid == "U2");
  std::cout << "[TEST] OK\n";
}

void test_newstate() {
  std::cout << "[TEST] Newstate is applied verbatim\n";
  StateTracker st{amilive::Settings{}};
  st.apply(newchannel("U1", "SIP/1001-00000001", "from-internal"));

  st.apply(event({{"Event", "Newstate"}, {"Uniqueid", "U1"}, {"ChannelState", "6"},
                  {"ChannelStateDesc", "Up"}}));
  TEST_CHECK(st.active_calls()[0].state == "Up");

  st.apply(event({{"Event", "Newstate"}, {"Uniqueid", "U1"}, {"ChannelState", "5"}}));
  TEST_CHECK(st.active_calls()[0].state == "5");

  st.apply(event({{"Event", "Newstate"}, {"Uniqueid", "U1"}}));
  TEST_CHECK(st.active_calls()[0].state == "unknown");

  st.apply(event({{"Event", "Newstate"}, {"Uniqueid", "ghost"}, {"ChannelStateDesc", "Up"}}));
  TEST_CHECK(st.active_calls().size() == 1);
  std::cout << "[TEST] OK\n";
}

void test_direction_and_extension_rules() {
  std::cout << "[TEST] direction markers and extension prefixes\n";
  StateTracker st{amilive::Settings{}};
  TEST_CHECK(st.classify_direction("from-pstn") == CallDirection::Inbound);
  TEST_CHECK(st.classify_direction("FROM-External-custom") == CallDirection::Inbound);
  TEST_CHECK(st.classify_direction("from-internal-xfer") == CallDirection::Outbound);
  TEST_CHECK(st.classify_direction("ext-queues") == CallDirection::Internal);
  TEST_CHECK(st.classify_direction("") == CallDirection::Internal);

  TEST_CHECK(st.extract_extension("SIP/1001-00000001") == "1001");
  TEST_CHECK(st.extract_extension("PJSIP/2002-0000001b") == "2002");
  TEST_CHECK(st.extract_extension("PJSIP/provider-0000001b").empty());
  TEST_CHECK(st.extract_extension("Local/100@from-queue-00000001;1").empty());
  TEST_CHECK(st.extract_extension("").empty());
  // Every occurrence of a prefix is tried, not just the first.
  TEST_CHECK(st.extract_extension("SIP/gw-SIP/1005-00000002") == "1005");
  TEST_CHECK(st.extract_extension("PJSIP/trunk;PJSIP/77-1") == "77");

  amilive::Settings custom;
  custom.inbound_context_markers = {"trunk-in"};
  custom.outbound_context_markers = {};
  custom.extension_prefixes = {"IAX2/"};
  StateTracker st2{custom};
  TEST_CHECK(st2.classify_direction("Trunk-In-1") == CallDirection::Inbound);
  TEST_CHECK(st2.classify_direction("from-internal") == CallDirection::Internal);
  TEST_CHECK(st2.extract_extension("IAX2/300-5") == "300");
  TEST_CHECK(st2.extract_extension("SIP/1001-1").empty());
  std::cout << "[TEST] OK\n";
}

void test_device_states() {
  std::cout << "[TEST] device state upserts\n";
  StateTracker st{amilive::Settings{}};
  st.apply(event({{"Event", "DeviceStateChange"}, {"Device", "SIP/1001"}, {"State", "INUSE"}}));
  st.apply(event({{"Event", "DeviceStateChange"}, {"Device", "SIP/1001"}, {"State", "NOT_INUSE"}}));
  st.apply(event({{"Event", "ExtensionStatus"}, {"Exten", "1002"}, {"Context", "ext-local"},
                  {"Hint", "PJSIP/1002"}, {"Status", "1"}, {"StatusText", "InUse"}}));
  st.apply(event({{"Event", "ExtensionStatus"}, {"Exten", "1003"}, {"Context", "ext-local"},
                  {"Status", "0"}}));
  st.apply(event({{"Event", "DeviceStateChange"}, {"State", "INUSE"}}));

  auto devices = st.device_states();
  TEST_CHECK(devices.size() == 3);
  TEST_CHECK(devices["SIP/1001"].state == "NOT_INUSE");
  TEST_CHECK(devices["SIP/1001"].device == "SIP/1001");
  TEST_CHECK(devices["PJSIP/1002"].state == "InUse");
  TEST_CHECK(devices["1003@ext-local"].state == "0");
  std::cout << "[TEST] OK\n";
}

void test_queue_events_carry_no_state() {
  std::cout << "[TEST] queue events are ignored by the tracker\n";
  StateTracker st{amilive::Settings{}};
  st.apply(event({{"Event", "QueueMemberStatus"}, {"Queue", "400"}, {"Interface", "SIP/1001"},
                  {"Status", "2"}}));
  st.apply(event({{"Event", "QueueParams"}, {"Queue", "400"}, {"Calls", "1"}}));
  st.apply(event({{"Event", "QueueEntry"}, {"Queue", "400"}, {"Uniqueid", "Q1"}}));
  TEST_CHECK(st.active_calls().empty());
  TEST_CHECK(st.device_states().empty());
  std::cout << "[TEST] OK\n";
}

void test_rename_callerid_bridge() {
  std::cout << "[TEST] Rename, NewCallerid, BridgeEnter/Leave\n";
  StateTracker st{amilive::Settings{}};
  st.apply(newchannel("U1", "SIP/1001-00000001", "from-internal"));
  st.apply(event({{"Event", "Rename"}, {"Uniqueid", "U1"}, {"Newname", "SIP/1005-00000001<MASQ>"}}));
  st.apply(event({{"Event", "NewCallerid"}, {"Uniqueid", "U1"}, {"CallerIDNum", "777"}}));
  st.apply(event({{"Event", "BridgeEnter"}, {"Uniqueid", "U1"}, {"BridgeUniqueid", "B1"}}));

  auto c = st.active_calls()[0];
  TEST_CHECK(c.channel == "SIP/1005-00000001<MASQ>");
  TEST_CHECK(c.extension == "1005");
  TEST_CHECK(c.caller_id == "777");
  TEST_CHECK(c.state == "bridged");

  st.apply(event({{"Event", "BridgeLeave"}, {"Uniqueid", "U1"}, {"BridgeUniqueid", "B1"}}));
  TEST_CHECK(st.active_calls()[0].state == "up");
  std::cout << "[TEST] OK\n";
}

void test_accessors_return_copies() {
  std::cout << "[TEST] accessors return copies; clear()\n";
  StateTracker st{amilive::Settings{}};
  st.apply(newchannel("U1", "SIP/1001-00000001", "from-internal"));
  st.apply(event({{"Event", "DeviceStateChange"}, {"Device", "SIP/1001"}, {"State", "INUSE"}}));

  auto calls = st.active_calls();
  calls[0].state = "tampered";
  calls.clear();
  auto devices = st.device_states();
  devices.clear();

  TEST_CHECK(st.active_calls().size() == 1);
  TEST_CHECK(st.active_calls()[0].state == "ringing");
  TEST_CHECK(st.device_states().size() == 1);

  st.clear();
  TEST_CHECK(st.active_calls().empty());
  TEST_CHECK(st.device_states().empty());
  std::cout << "[TEST] OK\n";
}

void test_duplicate_newchannel_keeps_one_record() {
  std::cout << "[TEST] one record per uniqueid\n";
  StateTracker st{amilive::Settings{}};
  st.apply(newchannel("U1", "SIP/1001-00000001", "from-internal"));
  st.apply(newchannel("U1", "SIP/1001-00000001", "from-internal"));
  st.apply(newchannel("", "SIP/1001-00000002", "from-internal"));
  TEST_CHECK(st.active_calls().size() == 1);
  std::cout << "[TEST] OK\n";
}

int main() {
  test_newchannel_example();
  test_hangup();
  test_newstate();
  test_direction_and_extension_rules();
  test_device_states();
  test_queue_events_carry_no_state();
  test_rename_callerid_bridge();
  test_accessors_return_copies();
  test_duplicate_newchannel_keeps_one_record();
  std::cout << "\n[ALL STATE TRACKER TESTS PASSED]\n";
  return 0;
}
