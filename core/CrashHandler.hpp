#pragma once

// Installs backward-cpp signal handlers that print a symbolized stack trace
// on SIGSEGV/SIGABRT and friends. Call once, after Log::Init().
namespace CrashHandler {

void Init();

} // namespace CrashHandler
