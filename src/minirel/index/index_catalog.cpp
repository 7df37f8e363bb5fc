#include <minirel/index/index_catalog.hpp>

#include <fstream>
#include <system_error>
#include <utility>

namespace minirel {

using json = nlohmann::json;

void to_json(json& j, const IndexMeta& meta) {
    j = json{
        {"table", meta.table},
        {"name", meta.name},
        {"column", meta.column},
        {"file", meta.file},
        {"type", meta.type},
        {"unique", meta.unique}
    };
}

void from_json(const json& j, IndexMeta& meta) {
    j.at("table").get_to(meta.table);
    j.at("name").get_to(meta.name);
    j.at("column").get_to(meta.column);
    j.at("file").get_to(meta.file);
    meta.type = j.value("type", std::string("BTREE"));
    meta.unique = j.value("unique", false);
}

Result<std::unique_ptr<JsonIndexCatalog>> JsonIndexCatalog::open(const fs::path& path) {
    auto catalog = std::unique_ptr<JsonIndexCatalog>(new JsonIndexCatalog(path));
    auto result = catalog->load();
    if (!result.ok()) {
        return result.error();
    }
    return std::move(catalog);
}

JsonIndexCatalog::JsonIndexCatalog(fs::path path)
    : path_(std::move(path))
{}

Result<void> JsonIndexCatalog::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Ok();
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        return Error(ErrorCode::IO_ERROR, "Failed to open index catalog " + path_.string());
    }

    try {
        json doc = json::parse(in);
        int version = doc.at("version").get<int>();
        if (version != FORMAT_VERSION) {
            return Error(ErrorCode::CORRUPTION,
                         "Index catalog " + path_.string() + " has unsupported version " +
                         std::to_string(version));
        }
        entries_ = doc.at("indexes").get<std::vector<IndexMeta>>();
    } catch (const json::exception& e) {
        return Error(ErrorCode::CORRUPTION,
                     "Index catalog " + path_.string() + " is unreadable: " + e.what());
    }

    return Ok();
}

Result<void> JsonIndexCatalog::save() const {
    json doc = {
        {"version", FORMAT_VERSION},
        {"indexes", entries_}
    };

    fs::path tmp = path_;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            return Error(ErrorCode::IO_ERROR, "Failed to write " + tmp.string());
        }
        out << doc.dump(2) << '\n';
        out.flush();
        if (!out.good()) {
            return Error(ErrorCode::IO_ERROR, "Failed to write " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Failed to replace " + path_.string() + ": " + ec.message());
    }
    return Ok();
}

Result<void> JsonIndexCatalog::add(const IndexMeta& meta) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& existing : entries_) {
        if (existing.table == meta.table && existing.name == meta.name) {
            return Error(ErrorCode::ALREADY_EXISTS,
                         "Index " + meta.name + " already exists on " + meta.table);
        }
    }

    entries_.push_back(meta);
    auto saved = save();
    if (!saved.ok()) {
        entries_.pop_back();
    }
    return saved;
}

Result<void> JsonIndexCatalog::remove(const std::string& table, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->table == table && it->name == name) {
            IndexMeta removed = *it;
            size_t pos = static_cast<size_t>(it - entries_.begin());
            entries_.erase(it);

            auto saved = save();
            if (!saved.ok()) {
                entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(pos), removed);
            }
            return saved;
        }
    }

    return Error(ErrorCode::NOT_FOUND, "No index " + name + " on " + table);
}

std::optional<IndexMeta> JsonIndexCatalog::get(const std::string& table,
                                               const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& meta : entries_) {
        if (meta.table == table && meta.name == name) {
            return meta;
        }
    }
    return std::nullopt;
}

std::vector<IndexMeta> JsonIndexCatalog::list(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<IndexMeta> out;
    for (const auto& meta : entries_) {
        if (meta.table == table) {
            out.push_back(meta);
        }
    }
    return out;
}

std::vector<IndexMeta> JsonIndexCatalog::list_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

}  // namespace minirel
