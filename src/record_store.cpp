#include "ecp/record_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <zstd.h>

namespace fs = std::filesystem;

namespace ecp {

namespace {

// Staging file next to target; unique per thread and call.
fs::path staging_path(const fs::path &target) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  static thread_local uint64_t counter = 0;
  std::ostringstream name;
  name << ".stage_" << std::hex << rng() << "_" << ++counter;
  return target.parent_path() / name.str();
}

// Readers see either the previous record or the complete new one.
bool write_replace(const fs::path &target, const std::string &bytes) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec)
    return false;

  const fs::path staged = staging_path(target);
  std::ofstream file(staged, std::ios::binary | std::ios::trunc);
  bool written = static_cast<bool>(file);
  if (written) {
    file << bytes;
    file.close();
    written = !file.fail();
  }
  if (written)
    fs::rename(staged, target, ec);
  if (!written || ec) {
    fs::remove(staged, ec);
    return false;
  }
  return true;
}

constexpr const char *kPlainExt = ".json";
constexpr const char *kZstdExt = ".json.zst";

std::optional<std::string> compress_zstd(const std::string &data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n))
    return std::nullopt;
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string &data) {
  const unsigned long long size =
      ZSTD_getFrameContentSize(data.data(), data.size());
  if (size == ZSTD_CONTENTSIZE_ERROR || size == ZSTD_CONTENTSIZE_UNKNOWN)
    return std::nullopt;
  std::string out;
  out.resize(static_cast<size_t>(size));
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != out.size())
    return std::nullopt;
  return out;
}

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool valid_record_key(const std::string &key) {
  if (key.empty() || key.size() > 255 || key[0] == '.')
    return false;
  for (char c : key) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
    if (!ok)
      return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// FsRecordStore
// ---------------------------------------------------------------------------

FsRecordStore::FsRecordStore(std::string root,
                             std::set<std::string> compressed_collections)
    : root_(std::move(root)), compressed_(std::move(compressed_collections)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
}

std::string FsRecordStore::record_path(const std::string &collection,
                                       const std::string &key) const {
  return (fs::path(root_) / collection /
          (key + (is_compressed(collection) ? kZstdExt : kPlainExt)))
      .string();
}

bool FsRecordStore::put(const std::string &collection, const std::string &key,
                        const std::string &json) {
  if (!valid_record_key(collection) || !valid_record_key(key))
    return false;
  if (!is_compressed(collection))
    return write_replace(record_path(collection, key), json);
  auto packed = compress_zstd(json);
  if (!packed)
    return false;
  return write_replace(record_path(collection, key), *packed);
}

bool FsRecordStore::remove(const std::string &collection,
                           const std::string &key) {
  if (!valid_record_key(collection) || !valid_record_key(key))
    return false;
  std::error_code ec;
  fs::remove(record_path(collection, key), ec);
  return !ec;
}

std::optional<std::string> FsRecordStore::get(const std::string &collection,
                                              const std::string &key) const {
  if (!valid_record_key(collection) || !valid_record_key(key))
    return std::nullopt;
  std::ifstream ifs(record_path(collection, key), std::ios::binary);
  if (!ifs)
    return std::nullopt;
  std::ostringstream ss;
  ss << ifs.rdbuf();
  if (!is_compressed(collection))
    return ss.str();
  // A record that fails to decompress reads as absent; the consistency
  // checker reports it as undecodable through the archive listing.
  return decompress_zstd(ss.str());
}

bool FsRecordStore::contains(const std::string &collection,
                             const std::string &key) const {
  if (!valid_record_key(collection) || !valid_record_key(key))
    return false;
  std::error_code ec;
  return fs::exists(record_path(collection, key), ec);
}

std::vector<std::string>
FsRecordStore::list_keys(const std::string &collection) const {
  std::vector<std::string> out;
  if (!valid_record_key(collection))
    return out;
  const fs::path dir = fs::path(root_) / collection;
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return out;
  const std::string ext = is_compressed(collection) ? kZstdExt : kPlainExt;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file(ec))
      continue;
    const std::string name = it->path().filename().string();
    // Skip in-flight temp files and anything that is not a record.
    if (name.rfind(".stage_", 0) == 0 || !ends_with(name, ext))
      continue;
    out.push_back(name.substr(0, name.size() - ext.size()));
  }
  // Directory iteration order is filesystem-dependent.
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t FsRecordStore::size(const std::string &collection) const {
  return list_keys(collection).size();
}

// ---------------------------------------------------------------------------
// MemoryRecordStore
// ---------------------------------------------------------------------------

bool MemoryRecordStore::put(const std::string &collection,
                            const std::string &key, const std::string &json) {
  if (!valid_record_key(collection) || !valid_record_key(key))
    return false;
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_writes_)
    return false;
  data_[collection][key] = json;
  return true;
}

bool MemoryRecordStore::remove(const std::string &collection,
                               const std::string &key) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_writes_)
    return false;
  auto c = data_.find(collection);
  if (c != data_.end())
    c->second.erase(key);
  return true;
}

std::optional<std::string>
MemoryRecordStore::get(const std::string &collection,
                       const std::string &key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto c = data_.find(collection);
  if (c == data_.end())
    return std::nullopt;
  auto it = c->second.find(key);
  if (it == c->second.end())
    return std::nullopt;
  return it->second;
}

bool MemoryRecordStore::contains(const std::string &collection,
                                 const std::string &key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto c = data_.find(collection);
  return c != data_.end() && c->second.count(key) > 0;
}

std::vector<std::string>
MemoryRecordStore::list_keys(const std::string &collection) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  auto c = data_.find(collection);
  if (c == data_.end())
    return out;
  out.reserve(c->second.size());
  for (const auto &[k, _] : c->second)
    out.push_back(k);
  return out;
}

std::size_t MemoryRecordStore::size(const std::string &collection) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto c = data_.find(collection);
  return c == data_.end() ? 0 : c->second.size();
}

void MemoryRecordStore::set_fail_writes(bool fail) {
  std::lock_guard<std::mutex> lk(mu_);
  fail_writes_ = fail;
}

} // namespace ecp
