#include <minirel/index/btree_index.hpp>

#include <utility>

namespace minirel {

BTreeIndex::BTreeIndex(IndexMeta meta, FileHandle* handle, size_t order, Logger* logger)
    : meta_(std::move(meta))
    , handle_(handle)
    , file_(handle->pool.get())
    , tree_(order)
    , built_(false)
    , logger_(logger ? logger : null_logger())
{}

Result<void> BTreeIndex::ensure_built() {
    if (built_) {
        return Ok();
    }
    return rebuild();
}

Result<void> BTreeIndex::rebuild() {
    BPlusTree fresh(tree_.order());

    auto result = file_.for_each([&fresh](IndexEntry&& entry) {
        fresh.insert(entry.key, entry.row);
    });
    if (!result.ok()) {
        logger_->error("Rebuild of index " + meta_.table + "." + meta_.name + " failed: " +
                       result.error().to_string());
        return result;
    }

    tree_ = std::move(fresh);
    built_ = true;

    logger_->debug("Built index " + meta_.table + "." + meta_.name + " from " +
                   std::to_string(file_.page_count()) + " pages: " +
                   std::to_string(tree_.size()) + " entries, " +
                   std::to_string(tree_.key_count()) + " keys, height " +
                   std::to_string(tree_.height()));
    return Ok();
}

Result<void> BTreeIndex::insert(const Value& key, const Row& row) {
    auto built = ensure_built();
    if (!built.ok()) {
        return built;
    }

    auto appended = file_.append(key, row);
    if (!appended.ok()) {
        return appended;
    }

    tree_.insert(key, row);
    return Ok();
}

Result<std::vector<Row>> BTreeIndex::find(const Value& key) {
    auto built = ensure_built();
    if (!built.ok()) {
        return built.error();
    }
    return tree_.find(key);
}

Result<RangeIterator> BTreeIndex::range(const std::optional<Value>& lower,
                                        const std::optional<Value>& upper,
                                        bool lower_inclusive,
                                        bool upper_inclusive) {
    auto built = ensure_built();
    if (!built.ok()) {
        return built.error();
    }
    return tree_.range(lower, upper, lower_inclusive, upper_inclusive);
}

Result<std::vector<Row>> BTreeIndex::range_rows(const std::optional<Value>& lower,
                                                const std::optional<Value>& upper,
                                                bool lower_inclusive,
                                                bool upper_inclusive) {
    auto built = ensure_built();
    if (!built.ok()) {
        return built.error();
    }
    return tree_.range_rows(lower, upper, lower_inclusive, upper_inclusive);
}

Result<void> BTreeIndex::flush() {
    return handle_->pool->flush_all_pages();
}

}  // namespace minirel
