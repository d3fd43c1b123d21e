#include "maybesync/config.hpp"

#include <ostream>

namespace maybesync {

const char *to_string(build_mode m) noexcept {
  switch (m) {
  case build_mode::sync:
    return "sync";
  case build_mode::unsync:
    return "unsync";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, build_mode m) {
  return os << to_string(m);
}

std::ostream &operator<<(std::ostream &os, const build_info &info) {
  os << info.mode;
  if (info.alloc)
    os << "+alloc";
  return os;
}

inline namespace MAYBESYNC_MODE_NAMESPACE {

build_info linked_build() noexcept { return {mode, has_alloc}; }

} // namespace MAYBESYNC_MODE_NAMESPACE

} // namespace maybesync
