#pragma once

namespace slotwatch::util {

// Process-wide libcurl initialization; safe to call repeatedly and from any thread.
void EnsureCurlInitialized();

} // namespace slotwatch::util
