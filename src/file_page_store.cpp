#include <pagekey/page_store.hpp>

#include <pagekey/internal.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <system_error>
#include <utility>

namespace pagekey {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kPageExtension = ".md";

rocksdb::Status IOErrorFrom(const std::string& what, const fs::path& path,
                            const std::error_code& ec) {
  return rocksdb::Status::IOError(what + " " + path.string(), ec.message());
}

std::string TempSuffix() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return std::to_string(rng());
}

}  // namespace

FilePageStore::FilePageStore(fs::path data_dir, const Options& opt)
    : data_dir_(std::move(data_dir)), opt_(opt) {}

rocksdb::Status FilePageStore::Open(const std::string& data_dir,
                                    std::unique_ptr<FilePageStore>* out, const Options& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (data_dir.empty()) return rocksdb::Status::InvalidArgument("data_dir is empty");

  std::error_code ec;
  fs::create_directories(data_dir, ec);
  if (ec) return IOErrorFrom("cannot create", data_dir, ec);
  if (!fs::is_directory(data_dir, ec)) {
    return rocksdb::Status::InvalidArgument("not a directory", data_dir);
  }

  out->reset(new FilePageStore(fs::path(data_dir), opt));
  return rocksdb::Status::OK();
}

rocksdb::Status FilePageStore::ValidateKey(std::string_view key) const {
  if (key.empty()) return rocksdb::Status::InvalidArgument("storage key is empty");
  if (key == "." || key == ".." || key[0] == '.' || key == opt_.deleted_area_name ||
      key.find('/') != std::string_view::npos || key.find('\\') != std::string_view::npos ||
      key.find('\0') != std::string_view::npos) {
    return rocksdb::Status::InvalidArgument("storage key is not a plain file name",
                                            std::string(key));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status FilePageStore::ValidateArtifact(std::string_view file_name) const {
  rocksdb::Status s = ValidateKey(file_name);
  if (!s.ok()) return s;
  if (fs::path(std::string(file_name)).extension() == kPageExtension) {
    return rocksdb::Status::InvalidArgument("pages are not artifacts", std::string(file_name));
  }
  return rocksdb::Status::OK();
}

fs::path FilePageStore::PathFor(std::string_view key) const {
  return data_dir_ / (std::string(key) + std::string(kPageExtension));
}

rocksdb::Status FilePageStore::ReadRaw(std::string_view key, std::string* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  rocksdb::Status s = ValidateKey(key);
  if (!s.ok()) return s;

  const fs::path path = PathFor(key);
  std::shared_lock<std::shared_mutex> lock(mu_);

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return rocksdb::Status::NotFound("no page stored under key", std::string(key));
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return rocksdb::Status::IOError("cannot open", path.string());

  std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) return rocksdb::Status::IOError("read failed", path.string());

  *out = std::move(bytes);
  return rocksdb::Status::OK();
}

rocksdb::Status FilePageStore::WriteRaw(std::string_view key, std::string_view bytes) {
  rocksdb::Status s = ValidateKey(key);
  if (!s.ok()) return s;

  const fs::path path = PathFor(key);
  const fs::path tmp = data_dir_ / ("." + std::string(key) + ".tmp-" + TempSuffix());

  std::unique_lock<std::shared_mutex> lock(mu_);
  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return rocksdb::Status::IOError("cannot create", tmp.string());
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file.good()) {
      file.close();
      std::error_code ignored;
      fs::remove(tmp, ignored);
      return rocksdb::Status::IOError("write failed", tmp.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return IOErrorFrom("cannot rename into", path, ec);
  }

  if (opt_.metrics) opt_.metrics->Counter("pagekey.store.write_total", 1);
  return rocksdb::Status::OK();
}

rocksdb::Status FilePageStore::MoveToHoldingArea(const fs::path& path, const std::string& stem,
                                                 const std::string& extension) {
  std::error_code ec;
  const fs::path holding =
      data_dir_ / opt_.deleted_area_name / std::to_string(internal::WallClockSeconds());
  fs::create_directories(holding, ec);
  if (ec) return IOErrorFrom("cannot create", holding, ec);

  fs::path target = holding / (stem + extension);
  for (int n = 1; fs::exists(target, ec); ++n) {
    target = holding / (stem + "_" + std::to_string(n) + extension);
  }

  fs::rename(path, target, ec);
  if (ec) return IOErrorFrom("cannot move", path, ec);
  return rocksdb::Status::OK();
}

rocksdb::Status FilePageStore::SoftDelete(std::string_view key) {
  rocksdb::Status s = ValidateKey(key);
  if (!s.ok()) return s;

  const fs::path path = PathFor(key);
  std::unique_lock<std::shared_mutex> lock(mu_);

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return rocksdb::Status::NotFound("no page stored under key", std::string(key));
  }

  s = MoveToHoldingArea(path, std::string(key), std::string(kPageExtension));
  if (!s.ok()) return s;

  if (opt_.metrics) opt_.metrics->Counter("pagekey.store.soft_delete_total", 1);
  return rocksdb::Status::OK();
}

rocksdb::Status FilePageStore::ListKeys(std::vector<std::string>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::shared_lock<std::shared_mutex> lock(mu_);

  std::vector<std::string> keys;
  std::error_code ec;
  fs::directory_iterator it(data_dir_, ec);
  if (ec) return IOErrorFrom("cannot list", data_dir_, ec);

  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) return IOErrorFrom("cannot list", data_dir_, ec);

    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;

    const fs::path& p = it->path();
    const std::string name = p.filename().string();
    if (name.empty() || name[0] == '.' || p.extension() != kPageExtension) continue;
    keys.push_back(p.stem().string());
  }
  if (ec) return IOErrorFrom("cannot list", data_dir_, ec);

  std::sort(keys.begin(), keys.end());
  *out = std::move(keys);
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// Artifacts
// ---------------------------------------------------------------------------

rocksdb::Status FilePageStore::ListArtifacts(std::string_view extension,
                                             std::vector<std::string>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (extension.size() < 2 || extension[0] != '.' || extension == kPageExtension) {
    return rocksdb::Status::InvalidArgument("not an artifact extension", std::string(extension));
  }

  std::shared_lock<std::shared_mutex> lock(mu_);

  std::vector<std::string> names;
  std::error_code ec;
  fs::directory_iterator it(data_dir_, ec);
  if (ec) return IOErrorFrom("cannot list", data_dir_, ec);

  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) return IOErrorFrom("cannot list", data_dir_, ec);

    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;

    const fs::path& p = it->path();
    const std::string name = p.filename().string();
    if (name.empty() || name[0] == '.' || p.extension().string() != extension) continue;
    names.push_back(name);
  }
  if (ec) return IOErrorFrom("cannot list", data_dir_, ec);

  std::sort(names.begin(), names.end());
  *out = std::move(names);
  return rocksdb::Status::OK();
}

rocksdb::Status FilePageStore::ArchiveArtifact(std::string_view file_name) {
  rocksdb::Status s = ValidateArtifact(file_name);
  if (!s.ok()) return s;

  const fs::path path = data_dir_ / std::string(file_name);
  std::unique_lock<std::shared_mutex> lock(mu_);

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return rocksdb::Status::NotFound("no such artifact", std::string(file_name));
  }

  s = MoveToHoldingArea(path, path.stem().string(), path.extension().string());
  if (!s.ok()) return s;

  if (opt_.metrics) opt_.metrics->Counter("pagekey.store.archive_total", 1);
  return rocksdb::Status::OK();
}

}  // namespace pagekey
