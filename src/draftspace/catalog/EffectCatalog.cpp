#include <draftspace/catalog/EffectCatalog.hpp>

#include "log/TaggedLogger.hpp"

#include <cassert>
#include <fstream>
#include <sstream>
#include <utility>

namespace DS {

namespace {

using json = nlohmann::json;

constexpr std::array<std::pair<CatalogKind, char const*>, kCatalogKindCount> kCatalogKeys{{
    {CatalogKind::Font, "fonts"},
    {CatalogKind::IntroAnimation, "intro"},
    {CatalogKind::OutroAnimation, "outro"},
    {CatalogKind::TextIntroAnimation, "text_intro"},
    {CatalogKind::TextOutroAnimation, "text_outro"},
    {CatalogKind::Transition, "transitions"},
    {CatalogKind::Filter, "filters"},
}};

struct BuiltinEntry {
    CatalogKind kind;
    char const* name;
    char const* id;
};

// Default table used when no catalog file is configured.
constexpr std::array<BuiltinEntry, 17> kBuiltinEntries{{
    {CatalogKind::Font, "文轩体", "builtin.font.wenxuan"},
    {CatalogKind::Font, "新青年体", "builtin.font.xinqingnian"},
    {CatalogKind::Font, "思源黑体", "builtin.font.source_han_sans"},
    {CatalogKind::IntroAnimation, "斜切", "builtin.intro.oblique_cut"},
    {CatalogKind::IntroAnimation, "渐显", "builtin.intro.fade_in"},
    {CatalogKind::IntroAnimation, "放大", "builtin.intro.zoom_in"},
    {CatalogKind::OutroAnimation, "渐隐", "builtin.outro.fade_out"},
    {CatalogKind::OutroAnimation, "缩小", "builtin.outro.zoom_out"},
    {CatalogKind::TextIntroAnimation, "打字机", "builtin.text_intro.typewriter"},
    {CatalogKind::TextIntroAnimation, "渐显", "builtin.text_intro.fade_in"},
    {CatalogKind::TextOutroAnimation, "故障闪动", "builtin.text_outro.glitch_flash"},
    {CatalogKind::TextOutroAnimation, "渐隐", "builtin.text_outro.fade_out"},
    {CatalogKind::Transition, "信号故障", "builtin.transition.signal_glitch"},
    {CatalogKind::Transition, "叠化", "builtin.transition.dissolve"},
    {CatalogKind::Transition, "闪白", "builtin.transition.flash_white"},
    {CatalogKind::Filter, "黑白", "builtin.filter.monochrome"},
    {CatalogKind::Filter, "复古", "builtin.filter.vintage"},
}};

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

} // namespace

auto catalogKindKey(CatalogKind kind) -> std::string_view {
    auto const index = static_cast<std::size_t>(kind);
    if (index >= kCatalogKeys.size()) {
        return "unknown";
    }
    return kCatalogKeys[index].second;
}

auto parseCatalogKind(std::string_view key) -> std::optional<CatalogKind> {
    for (auto const& [kind, name] : kCatalogKeys) {
        if (key == name) {
            return kind;
        }
    }
    return std::nullopt;
}

auto EffectCatalog::Builtin() -> EffectCatalog {
    EffectCatalog catalog;
    for (auto const& entry : kBuiltinEntries) {
        [[maybe_unused]] auto added = catalog.add(entry.kind, entry.name, entry.id);
        assert(added.has_value() && "built-in table has a duplicate entry");
    }
    return catalog;
}

auto EffectCatalog::FromJson(json const& document) -> Expected<EffectCatalog> {
    if (!document.is_object()) {
        return std::unexpected(malformed("catalog document must be a JSON object"));
    }

    EffectCatalog catalog;
    for (auto const& [key, entries] : document.items()) {
        auto kind = parseCatalogKind(key);
        if (!kind) {
            return std::unexpected(malformed("unknown catalog '" + key + "'"));
        }
        if (!entries.is_array()) {
            return std::unexpected(malformed("catalog '" + key + "' must be an array"));
        }
        for (auto const& entry : entries) {
            std::string name;
            std::string id;
            if (entry.is_string()) {
                name = entry.get<std::string>();
                id   = name;
            } else if (entry.is_object()) {
                auto name_it = entry.find("name");
                auto id_it   = entry.find("id");
                if (name_it == entry.end() || !name_it->is_string() || id_it == entry.end()
                    || !id_it->is_string()) {
                    return std::unexpected(
                        malformed("entries in '" + key + "' need string 'name' and 'id' fields"));
                }
                name = name_it->get<std::string>();
                id   = id_it->get<std::string>();
            } else {
                return std::unexpected(malformed("entries in '" + key + "' must be strings or objects"));
            }
            if (name.empty()) {
                return std::unexpected(malformed("catalog '" + key + "' contains an empty name"));
            }
            if (auto added = catalog.add(*kind, std::move(name), std::move(id)); !added) {
                return std::unexpected(added.error());
            }
        }
    }
    return catalog;
}

auto EffectCatalog::LoadFile(std::filesystem::path const& file) -> Expected<EffectCatalog> {
    std::ifstream stream(file, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot open catalog file " + file.string()});
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();

    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(malformed("catalog file " + file.string() + " is not valid JSON"));
    }
    auto catalog = FromJson(document);
    if (catalog) {
        ds_log("Loaded effect catalog from " + file.string(), "Catalog");
    }
    return catalog;
}

auto EffectCatalog::add(CatalogKind kind, std::string name, std::string id) -> Expected<void> {
    auto const index = static_cast<std::size_t>(kind);
    if (index >= tables_.size()) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "invalid catalog kind"});
    }
    auto& table = tables_[index];
    if (table.ids.contains(name)) {
        return std::unexpected(Error{Error::Code::DuplicateId,
                                     "duplicate name '" + name + "' in catalog "
                                         + std::string{catalogKindKey(kind)}});
    }
    table.order.push_back(name);
    table.ids.emplace(std::move(name), std::move(id));
    return {};
}

auto EffectCatalog::lookup(CatalogKind kind, std::string_view name) const -> Expected<EffectRef> {
    auto const index = static_cast<std::size_t>(kind);
    if (index < tables_.size()) {
        auto const& ids = tables_[index].ids;
        if (auto it = ids.find(name); it != ids.end()) {
            return EffectRef{kind, it->first, it->second};
        }
    }
    return std::unexpected(Error{Error::Code::UnknownEffectName,
                                 "unknown " + std::string{catalogKindKey(kind)} + " name '"
                                     + std::string{name} + "'"});
}

auto EffectCatalog::names(CatalogKind kind) const -> std::vector<std::string> {
    auto const index = static_cast<std::size_t>(kind);
    if (index >= tables_.size()) {
        return {};
    }
    return tables_[index].order;
}

auto EffectCatalog::size(CatalogKind kind) const -> std::size_t {
    auto const index = static_cast<std::size_t>(kind);
    return index < tables_.size() ? tables_[index].order.size() : 0;
}

} // namespace DS
