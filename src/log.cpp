#include <mpchat/log.h>

namespace mpchat::log {

std::shared_ptr<Sink> Log::sink = nullptr;
Level Log::threshold = Level::debug;

void
Log::set_sink(std::shared_ptr<Sink> sink_in)
{
  sink = std::move(sink_in);
}

void
Log::remove_sink()
{
  sink = nullptr;
}

void
Log::set_level(Level level)
{
  threshold = level;
}

Level
Log::level()
{
  return threshold;
}

} // namespace mpchat::log
