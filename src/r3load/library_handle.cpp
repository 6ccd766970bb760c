#include "r3load/library_handle.hpp"

#include <cstdint>
#include <string>
#include <utility>

#if defined(_WIN32)
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace r3::load {
namespace {

#if defined(_WIN32)
std::string last_loader_error() {
  DWORD code = GetLastError();
  return "win32 error " + std::to_string(static_cast<unsigned long>(code));
}
#else
std::string last_loader_error() {
  const char* message = dlerror();
  return message ? std::string(message) : std::string("unknown loader error");
}
#endif

} // namespace

library_handle::library_handle(void* native, std::filesystem::path path)
    : native_(native), path_(std::move(path)), log_(redlog::get_logger("r3.load.library")) {}

library_handle::~library_handle() {
  status closed = close();
  if (!closed.ok()) {
    log_.wrn("failed to close library", redlog::field("path", path_.string()), redlog::field("error", closed.message));
  }
}

result<std::unique_ptr<library_handle>> library_handle::open(const std::filesystem::path& path) {
  auto log = redlog::get_logger("r3.load.library");

#if defined(_WIN32)
  void* native = reinterpret_cast<void*>(LoadLibraryA(path.string().c_str()));
#else
  void* native = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
#endif
  if (!native) {
    std::string message = last_loader_error();
    log.err("failed to open library", redlog::field("path", path.string()), redlog::field("error", message));
    return error_result<std::unique_ptr<library_handle>>(
        error_code::load_error, "failed to open " + path.string() + ": " + message
    );
  }

  log.dbg("opened library", redlog::field("path", path.string()));
  return ok_result(std::unique_ptr<library_handle>(new library_handle(native, path)));
}

status library_handle::close() {
  if (!native_) {
    return ok_status();
  }

#if defined(_WIN32)
  bool released = FreeLibrary(reinterpret_cast<HMODULE>(native_)) != 0;
#else
  bool released = dlclose(native_) == 0;
#endif
  native_ = nullptr;
  if (!released) {
    return make_status(error_code::load_error, "failed to close " + path_.string() + ": " + last_loader_error());
  }

  log_.dbg("closed library", redlog::field("path", path_.string()));
  return ok_status();
}

result<void*> library_handle::symbol(std::string_view name) const {
  if (!native_) {
    return error_result<void*>(error_code::library_not_loaded, "library is closed");
  }

  std::string symbol_name(name);
#if defined(_WIN32)
  void* address = reinterpret_cast<void*>(GetProcAddress(reinterpret_cast<HMODULE>(native_), symbol_name.c_str()));
  if (!address) {
    return error_result<void*>(error_code::symbol_not_found, "symbol not found: " + symbol_name);
  }
#else
  // a null symbol value is legal, so clear and then check dlerror
  dlerror();
  void* address = dlsym(native_, symbol_name.c_str());
  if (const char* message = dlerror()) {
    return error_result<void*>(error_code::symbol_not_found, "symbol not found: " + symbol_name + " (" + message + ")");
  }
#endif

  log_.ped(
      "resolved symbol", redlog::field("name", symbol_name),
      redlog::field("address", "0x%016llx", static_cast<unsigned long long>(reinterpret_cast<uintptr_t>(address)))
  );
  return ok_result(address);
}

} // namespace r3::load
