#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "event/interpreter.hpp"
#include "event/raw_event.hpp"

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data,
                                      std::size_t size) {
  using namespace tonsentry::event;

  if (data == nullptr || size < 1) return 0;

  // First byte picks the reference wallet so both directions are reached.
  const std::string_view wallet = (data[0] & 1) ? "A" : "";
  const std::string_view text(reinterpret_cast<const char*>(data + 1), size - 1);

  RawEvent event;
  std::string error;
  if (!ParseRawEventText(text, &event, &error)) return 0;

  const EventInterpretation result = Interpret(event, wallet);
  if (result.description.find("https://") != std::string::npos) std::abort();
  if (result.is_scam_risk && result.direction == Direction::kNeutral) std::abort();

  return 0;
}
