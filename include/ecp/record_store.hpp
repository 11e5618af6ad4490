#pragma once

// ecp/record_store.hpp - Keyed text-record storage for classifications,
// consensus records, violations, escalations and rulings.
//
// Layout (FsRecordStore):
//   <root>/<collection>/<key>.json
//   <root>/<collection>/<key>.json.zst   (collections opened as compressed)
// Each record is one canonical JSON document. Compression is transparent:
// get() always returns the JSON text, so digests are taken over the
// uncompressed form. Writes go through a temp file
// and rename(), so a reader sees either the previous or the new version of a
// record, never a torn one.
//
// Records are keyed by deterministic ids (event ids, classifier ids,
// violation ids). There is no delete: violations and rulings are permanent,
// classifications are superseded by archiving, consensus records are
// overwritten in place.
//
// EXTENSION_POINT: embedded_store_backend
//   Current: one file per record, enumeration by directory listing at startup.
//   Upgrade path: an embedded KV backend implementing IRecordStore. Callers
//   already keep their own in-memory indexes and only enumerate on load.

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ecp {

namespace collections {
constexpr const char *kClassifications = "classifications";
constexpr const char *kClassificationArchive = "classification_archive";
constexpr const char *kConsensus = "consensus";
constexpr const char *kViolations = "violations";
constexpr const char *kEscalations = "escalations";
constexpr const char *kRulings = "rulings";
} // namespace collections

// True if key is safe as a single path component.
bool valid_record_key(const std::string &key);

// ---------------------------------------------------------------------------
// IRecordStore
// ---------------------------------------------------------------------------
// Thread-safety: all implementations MUST be safe for concurrent calls.
// Per-key serialization of read-modify-write sequences is the caller's job
// (see ImmutabilityGuard).
class IRecordStore {
public:
  virtual ~IRecordStore() = default;

  // Store (or overwrite) a record. Returns false on invalid key or I/O failure.
  virtual bool put(const std::string &collection, const std::string &key,
                   const std::string &json) = 0;

  // Delete a record. Removing an absent record succeeds.
  virtual bool remove(const std::string &collection,
                      const std::string &key) = 0;

  // Retrieve a record. Returns nullopt if not found.
  virtual std::optional<std::string> get(const std::string &collection,
                                         const std::string &key) const = 0;

  virtual bool contains(const std::string &collection,
                        const std::string &key) const = 0;

  // Keys of a collection in lexicographic order.
  virtual std::vector<std::string>
  list_keys(const std::string &collection) const = 0;

  virtual std::size_t size(const std::string &collection) const = 0;

  // Human-readable backend identifier for diagnostics.
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// FsRecordStore - local filesystem backend
// ---------------------------------------------------------------------------
class FsRecordStore : public IRecordStore {
public:
  // Records in compressed_collections are stored zstd-compressed.
  explicit FsRecordStore(std::string root = ".ecp",
                         std::set<std::string> compressed_collections = {});

  bool put(const std::string &collection, const std::string &key,
           const std::string &json) override;
  bool remove(const std::string &collection,
              const std::string &key) override;
  std::optional<std::string> get(const std::string &collection,
                                 const std::string &key) const override;
  bool contains(const std::string &collection,
                const std::string &key) const override;
  std::vector<std::string>
  list_keys(const std::string &collection) const override;
  std::size_t size(const std::string &collection) const override;
  std::string backend_id() const override { return "fs:" + root_; }

  const std::string &root() const { return root_; }
  std::string record_path(const std::string &collection,
                          const std::string &key) const;

private:
  bool is_compressed(const std::string &collection) const {
    return compressed_.count(collection) > 0;
  }

  std::string root_;
  std::set<std::string> compressed_;
};

// ---------------------------------------------------------------------------
// MemoryRecordStore - process-local backend for tests and --memory runs
// ---------------------------------------------------------------------------
class MemoryRecordStore : public IRecordStore {
public:
  bool put(const std::string &collection, const std::string &key,
           const std::string &json) override;
  bool remove(const std::string &collection,
              const std::string &key) override;
  std::optional<std::string> get(const std::string &collection,
                                 const std::string &key) const override;
  bool contains(const std::string &collection,
                const std::string &key) const override;
  std::vector<std::string>
  list_keys(const std::string &collection) const override;
  std::size_t size(const std::string &collection) const override;
  std::string backend_id() const override { return "memory"; }

  // Test hook: while set, every put() and remove() fails.
  void set_fail_writes(bool fail);

private:
  mutable std::mutex mu_;
  std::map<std::string, std::map<std::string, std::string>> data_;
  bool fail_writes_{false};
};

} // namespace ecp
