#include "events/event_model.hpp"

#include "core/json_utils.hpp"

#include <string>

namespace missionline::events {

std::string ToJson(const RawEvent& event) {
  core::JsonObjectWriter payload;
  if (event.payload.run_id.has_value()) {
    payload.String("run_id", *event.payload.run_id);
  }
  if (event.payload.phase.has_value()) {
    payload.String("phase", *event.payload.phase);
  }
  if (event.payload.invalid_seq) {
    payload.String("seq", "invalid");
  } else if (event.payload.seq.has_value()) {
    payload.Raw("seq", std::to_string(*event.payload.seq));
  }
  if (event.payload.status.has_value()) {
    payload.String("status", *event.payload.status);
  }

  core::JsonObjectWriter out;
  out.String("type", event.type);
  out.Raw("payload", payload.Finish());
  return out.Finish();
}

} // namespace missionline::events
