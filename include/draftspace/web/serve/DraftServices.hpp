#pragma once

#include <draftspace/catalog/EffectCatalog.hpp>
#include <draftspace/compose/SegmentComposer.hpp>
#include <draftspace/registry/DraftRegistry.hpp>
#include <draftspace/session/DraftWriter.hpp>
#include <draftspace/session/SessionController.hpp>

#include <utility>

namespace DS::Serve {

// Everything a request handler may touch. Member order is construction order.
struct DraftServices {
    explicit DraftServices(EffectCatalog effects)
        : catalog(std::move(effects))
        , sessions(registry, writer)
        , composer(registry, catalog) {}

    DraftServices(DraftServices const&)            = delete;
    DraftServices& operator=(DraftServices const&) = delete;

    EffectCatalog const catalog;
    DraftRegistry       registry;
    JsonDraftWriter     writer;
    SessionController   sessions;
    SegmentComposer     composer;
};

} // namespace DS::Serve
