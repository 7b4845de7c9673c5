#include "slotkeeper/observability/factory.hpp"

#include "slotkeeper/common/fs.hpp"
#include "slotkeeper/observability/log_observer.hpp"
#include "slotkeeper/observability/multi_observer.hpp"
#include "slotkeeper/observability/noop_observer.hpp"

#include <sstream>

namespace slotkeeper::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend) {
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return create_single(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty()) {
      multi->add(create_single(name));
    }
  }
  return multi;
}

} // namespace slotkeeper::observability
