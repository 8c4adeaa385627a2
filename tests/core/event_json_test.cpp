#include "events/event_model.hpp"
#include "timeline/normalizer.hpp"
#include "timeline/reducer.hpp"
#include "timeline/timeline_state.hpp"

#include <catch2/catch.hpp>

#include <string>

TEST_CASE("Phase status and outcome names are stable", "[core][events][json]") {
  using missionline::timeline::ApplyOutcome;
  using missionline::timeline::PhaseStatus;
  using missionline::timeline::ToString;

  REQUIRE(std::string(ToString(PhaseStatus::kRunning)) == "running");
  REQUIRE(std::string(ToString(PhaseStatus::kCompleted)) == "completed");
  REQUIRE(std::string(ToString(ApplyOutcome::kAccepted)) == "accepted");
  REQUIRE(std::string(ToString(ApplyOutcome::kReset)) == "reset");
  REQUIRE(std::string(ToString(ApplyOutcome::kStale)) == "stale");
  REQUIRE(std::string(ToString(ApplyOutcome::kUnresolvedPhase)) == "unresolved_phase");
  REQUIRE(std::string(ToString(ApplyOutcome::kIllegalTransition)) == "illegal_transition");
  REQUIRE(std::string(ToString(ApplyOutcome::kMalformed)) == "malformed");
  REQUIRE(std::string(ToString(ApplyOutcome::kIgnored)) == "ignored");
}

TEST_CASE("Raw event JSON keeps present payload fields only", "[core][events][json]") {
  missionline::events::RawEvent event;
  event.type = "PHASE_STARTED";
  event.payload.run_id = "mission-9:2";
  event.payload.phase = "PLANNING";
  event.payload.seq = 14;

  REQUIRE(missionline::events::ToJson(event) ==
          R"({"type":"PHASE_STARTED","payload":{"run_id":"mission-9:2","phase":"PLANNING","seq":14}})");

  missionline::events::RawEvent bare;
  bare.type = "conversation_init";
  REQUIRE(missionline::events::ToJson(bare) == R"({"type":"conversation_init","payload":{}})");
}

TEST_CASE("Raw event JSON escapes strings and marks invalid sequences", "[core][events][json]") {
  missionline::events::RawEvent event;
  event.type = "phase_start";
  event.payload.phase = "say \"hi\"\n";
  event.payload.invalid_seq = true;
  event.payload.status = "running";

  REQUIRE(missionline::events::ToJson(event) ==
          R"({"type":"phase_start","payload":{"phase":"say \"hi\"\n","seq":"invalid","status":"running"}})");
}

TEST_CASE("Normalized event JSON uses null for absent fields", "[core][timeline][json]") {
  missionline::events::RawEvent event;
  event.type = "phase_completed";
  event.payload.phase = "EXECUTION";

  const std::string json =
      missionline::timeline::ToJson(missionline::timeline::Normalize(event));
  REQUIRE(json ==
          R"({"kind":"phase_completed","vocabulary":"legacy","run_id":null,"phase":"execute","status":"completed","seq":null,"malformed":false})");
}
