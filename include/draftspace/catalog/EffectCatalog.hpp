#pragma once

#include <draftspace/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DS {

enum class CatalogKind : std::size_t {
    Font = 0,
    IntroAnimation,
    OutroAnimation,
    TextIntroAnimation,
    TextOutroAnimation,
    Transition,
    Filter,
    Count,
};

inline constexpr std::size_t kCatalogKindCount = static_cast<std::size_t>(CatalogKind::Count);

// Key used for the catalog in catalog documents ("fonts", "intro", ...).
auto catalogKindKey(CatalogKind kind) -> std::string_view;
auto parseCatalogKind(std::string_view key) -> std::optional<CatalogKind>;

struct EffectRef {
    CatalogKind kind{CatalogKind::Font};
    std::string name;
    std::string id;

    auto operator==(EffectRef const&) const -> bool = default;
};

/**
 * Seven disjoint name -> identifier tables.
 *
 * Populated once at startup (built-in table or a JSON document) and only read
 * afterwards, so lookups take no lock. Names are matched exactly and
 * case-sensitively; each catalog keeps its insertion order for enumeration.
 */
class EffectCatalog {
public:
    EffectCatalog() = default;

    static auto Builtin() -> EffectCatalog;

    /**
     * Build from a document of the form
     *   {"fonts": [{"name": "...", "id": "..."}, "PlainName", ...], "intro": [...], ...}
     * Unknown top level keys are rejected. A bare string entry uses its name as id.
     */
    static auto FromJson(nlohmann::json const& document) -> Expected<EffectCatalog>;
    static auto LoadFile(std::filesystem::path const& file) -> Expected<EffectCatalog>;

    auto add(CatalogKind kind, std::string name, std::string id) -> Expected<void>;

    [[nodiscard]] auto lookup(CatalogKind kind, std::string_view name) const -> Expected<EffectRef>;
    [[nodiscard]] auto names(CatalogKind kind) const -> std::vector<std::string>;
    [[nodiscard]] auto size(CatalogKind kind) const -> std::size_t;

private:
    struct Table {
        std::vector<std::string>                       order;
        std::map<std::string, std::string, std::less<>> ids;
    };

    std::array<Table, kCatalogKindCount> tables_{};
};

} // namespace DS
