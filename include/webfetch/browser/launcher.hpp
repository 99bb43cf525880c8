#pragma once

#include "webfetch/browser/cdp.hpp"
#include "webfetch/common/cancel.hpp"
#include "webfetch/common/result.hpp"

#include <memory>

namespace webfetch::browser {

/// One running browser instance with a connected DevTools client. Destroying the
/// session tears down the connection, the process and the temporary profile.
class IBrowserSession {
public:
  virtual ~IBrowserSession() = default;

  [[nodiscard]] virtual CDPClient &client() = 0;
  /// Stop the browser immediately. Callable from any thread, more than once.
  virtual void abort() = 0;
};

class IBrowserLauncher {
public:
  virtual ~IBrowserLauncher() = default;

  /// Start a browser. Returns early with a failure when `cancel` fires.
  [[nodiscard]] virtual common::Result<std::unique_ptr<IBrowserSession>>
  launch(const common::CancellationToken &cancel) = 0;
};

} // namespace webfetch::browser
