#pragma once

#include <draftspace/core/Error.hpp>
#include <draftspace/web/ServeOptions.hpp>
#include <draftspace/web/serve/DraftServices.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string_view>

namespace DS::Serve {

struct ServeLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

// Loads the catalog named by options.catalog_path, or the built-in table when it is empty.
auto CreateDraftServices(ServeOptions const& options) -> DS::Expected<std::unique_ptr<DraftServices>>;

int RunDraftServer(DraftServices& services, ServeOptions const& options);

int RunDraftServerWithStopFlag(DraftServices&                          services,
                               ServeOptions const&                     options,
                               std::atomic<bool>&                      should_stop,
                               ServeLogHooks const&                    log_hooks = {},
                               std::function<void(DS::Expected<void>)> on_listen = {});

void RequestDraftServerStop();
void ResetDraftServerStopFlag();

} // namespace DS::Serve
