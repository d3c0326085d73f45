#include "internal.hpp"
#include <cassert>
#include <cerrno>
#include <filesystem>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fina {

// FileReader //////////////////////////////////////////////////////////////////

FileReader::FileReader(std::FILE* file)
    : file_(file)
    , size_(0)
    , position_(0) {
  assert(file_);

  // Determine the size of the file
  std::fseek(file_, 0, SEEK_END);
  size_ = std::ftell(file_);
  std::fseek(file_, 0, SEEK_SET);
}

uint64_t FileReader::size() const {
  return size_;
}

uint64_t FileReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= size_) {
    return 0;
  }

  if (offset != position_) {
    std::fseek(file_, (long)(offset), SEEK_SET);
    position_ = offset;
  }

  if (size > buffer_.size()) {
    buffer_.resize(size);
  }

  const uint64_t bytesRead = uint64_t(std::fread(buffer_.data(), 1, size, file_));
  *output = buffer_.data();

  position_ += bytesRead;
  return bytesRead;
}

// MappedFile //////////////////////////////////////////////////////////////////

MappedFile::~MappedFile() {
  close();
}

Status MappedFile::open(const std::string& filename) {
  close();

  fd_ = ::open(filename.c_str(), O_RDONLY);
  if (fd_ < 0) {
    const auto code = errno == ENOENT ? StatusCode::NotFound : StatusCode::OpenFailed;
    return Status{code, internal::StrCat("failed to open \"", filename, "\"")};
  }

  struct stat st;
  if (::fstat(fd_, &st) < 0) {
    close();
    return Status{StatusCode::OpenFailed, internal::StrCat("failed to stat \"", filename, "\"")};
  }
  size_ = uint64_t(st.st_size);
  if (size_ == 0) {
    // mmap() rejects empty mappings
    return StatusCode::Success;
  }

  void* mapped = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (mapped == MAP_FAILED) {
    close();
    return Status{StatusCode::MapFailed, internal::StrCat("failed to map \"", filename, "\"")};
  }
  data_ = static_cast<std::byte*>(mapped);
  ::madvise(mapped, size_, MADV_SEQUENTIAL);

  return StatusCode::Success;
}

void MappedFile::close() {
  if (data_) {
    ::munmap(data_, size_);
    data_ = nullptr;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  size_ = 0;
}

uint64_t MappedFile::size() const {
  return size_;
}

uint64_t MappedFile::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (!data_ || offset >= size_) {
    return 0;
  }

  // Touching pages past a truncated end raises SIGBUS
  uint64_t available = size_;
  struct stat st;
  if (::fstat(fd_, &st) < 0) {
    return 0;
  }
  available = std::min(available, uint64_t(st.st_size));
  if (offset >= available) {
    return 0;
  }

  *output = data_ + offset;
  return std::min(size, available - offset);
}

// MetaReader //////////////////////////////////////////////////////////////////

MetaReader::MetaReader(std::string_view dataDir, const ReaderOptions& options)
    : dataDir_(dataDir)
    , options_(options) {}

Status MetaReader::resolvePath(std::string_view fileName, std::string_view extension,
                               std::string* output) const {
  namespace fs = std::filesystem;

  if (extension != MetaExtension && extension != DataExtension) {
    const auto msg = internal::StrCat("extension \"", extension, "\" is not allowed for \"",
                                      fileName, "\"");
    return Status{StatusCode::PathSecurity, msg};
  }

  std::error_code ec;
  fs::path root = fs::absolute(fs::path(dataDir_), ec);
  if (ec) {
    const auto msg = internal::StrCat("cannot resolve data directory \"", dataDir_, "\": ",
                                      ec.message());
    return Status{StatusCode::PathSecurity, msg};
  }
  root = root.lexically_normal();
  if (!root.has_filename()) {
    root = root.parent_path();
  }

  const fs::path candidate =
    (root / (std::string(fileName) + std::string(extension))).lexically_normal();
  const auto [rootEnd, candidateEnd] =
    std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
  if (rootEnd != root.end() || candidateEnd == candidate.end() ||
      candidate.extension().string() != extension) {
    const auto msg = internal::StrCat("\"", candidate.string(), "\" is outside of \"",
                                      root.string(), "\"");
    return Status{StatusCode::PathSecurity, msg};
  }

  *output = candidate.string();
  return StatusCode::Success;
}

Status MetaReader::checkFile(const std::string& path, uint64_t limit, uint64_t* size) const {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return Status{StatusCode::NotFound, internal::StrCat("file \"", path, "\" does not exist")};
  }
  const auto fileSize = fs::file_size(path, ec);
  if (ec) {
    const auto msg = internal::StrCat("cannot read size of \"", path, "\": ", ec.message());
    return Status{StatusCode::ReadFailed, msg};
  }
  if (fileSize > limit) {
    const auto msg = internal::StrCat("file \"", path, "\" is ", uint64_t(fileSize),
                                      " bytes, limit is ", limit);
    return Status{StatusCode::SizeLimit, msg};
  }
  *size = uint64_t(fileSize);
  return StatusCode::Success;
}

Status MetaReader::read(std::string_view fileName, FileMeta* output) const {
  std::string metaPath;
  std::string dataPath;
  if (auto status = resolvePath(fileName, MetaExtension, &metaPath); !status.ok()) {
    return status;
  }
  if (auto status = resolvePath(fileName, DataExtension, &dataPath); !status.ok()) {
    return status;
  }

  const auto wrap = [&metaPath](const Status& status) {
    return Status{status.code,
                  internal::StrCat("error reading meta file '", metaPath, "': ", status.message)};
  };

  uint64_t metaSize = 0;
  uint64_t dataSize = 0;
  if (auto status = checkFile(metaPath, options_.maxMetaSize, &metaSize); !status.ok()) {
    return wrap(status);
  }
  if (auto status = checkFile(dataPath, options_.maxDataSize, &dataSize); !status.ok()) {
    return wrap(status);
  }
  if (dataSize % PointSize != 0) {
    const auto msg = internal::StrCat("data file \"", dataPath, "\" size ", dataSize,
                                      " is not a multiple of ", PointSize, " bytes");
    return wrap(Status{StatusCode::Corrupt, msg});
  }

  std::FILE* file = std::fopen(metaPath.c_str(), "rb");
  if (!file) {
    return wrap(Status{StatusCode::OpenFailed, internal::StrCat("failed to open \"", metaPath, "\"")});
  }
  FileReader metaSource{file};
  const auto status = ParseMeta(metaSource, dataSize, output);
  std::fclose(file);
  if (!status.ok()) {
    return wrap(status);
  }
  return StatusCode::Success;
}

Status MetaReader::ParseMeta(IReadable& source, uint64_t dataSize, FileMeta* output) {
  std::byte* data = nullptr;
  const uint64_t bytesRead = source.read(&data, MetaHeaderSize, MetaRecordSize);
  if (bytesRead != MetaRecordSize) {
    const auto msg = internal::StrCat("meta file is corrupted: expected ", MetaRecordSize,
                                      " bytes at offset ", MetaHeaderSize, ", found ", bytesRead);
    return Status{StatusCode::Corrupt, msg};
  }

  FileMeta meta;
  meta.interval = Timestamp(internal::ParseUint32(data));
  meta.startTime = Timestamp(internal::ParseUint32(data + 4));
  meta.size = dataSize;
  meta.npoints = dataSize / PointSize;
  if (meta.startTime > 0) {
    meta.endTime = meta.startTime + Timestamp(meta.npoints) * meta.interval - meta.interval;
  }
  if (auto status = meta.validate(); !status.ok()) {
    return status;
  }

  *output = meta;
  return StatusCode::Success;
}

// ChunkView ///////////////////////////////////////////////////////////////////

ChunkView::ChunkView(std::string_view dataPath, const SearchPlanner& planner,
                     const ReadPlan& plan, ReadCursor& cursor, bool autoAdvance,
                     const ProblemCallback& onProblem)
    : dataPath_(dataPath)
    , planner_(planner)
    , plan_(plan)
    , cursor_(cursor)
    , autoAdvance_(autoAdvance)
    , onProblem_(onProblem) {}

ChunkView::Iterator ChunkView::begin() {
  if (begun_ || cursor_.remainingPoints <= 0) {
    return end();
  }
  begun_ = true;
  return ChunkView::Iterator{*this};
}

ChunkView::Iterator ChunkView::end() {
  return ChunkView::Iterator();
}

// ChunkView::Iterator /////////////////////////////////////////////////////////

ChunkView::Iterator::Iterator(ChunkView& view)
    : impl_(std::make_unique<Impl>(view)) {
  if (!impl_->has_value()) {
    impl_ = nullptr;
  }
}

ChunkView::Iterator::Impl::Impl(ChunkView& view)
    : view_(view) {
  if (auto status = file_.open(view_.dataPath_); !status.ok()) {
    view_.onProblem_(status);
    return;
  }
  readChunk();
}

void ChunkView::Iterator::Impl::increment() {
  hasChunk_ = false;
  auto& cursor = view_.cursor_;

  if (view_.autoAdvance_) {
    if (auto status = view_.planner_.advance(view_.plan_, cursor, chunk_.size()); !status.ok()) {
      view_.onProblem_(status);
      return;
    }
  } else if (cursor.currentPos == chunkPos_ && cursor.remainingPoints > 0) {
    view_.onProblem_(Status{
      StatusCode::StuckRead,
      internal::StrCat("cursor was not advanced past the chunk at position ", chunkPos_)});
    return;
  }

  readChunk();
}

void ChunkView::Iterator::Impl::readChunk() {
  const auto& cursor = view_.cursor_;
  if (cursor.remainingPoints <= 0) {
    return;
  }

  const uint64_t count = std::min(cursor.chunkSize, uint64_t(cursor.remainingPoints));
  if (count == 0) {
    view_.onProblem_(Status{StatusCode::StuckRead,
                            internal::StrCat("chunk size is zero at position ", cursor.currentPos,
                                             " with ", cursor.remainingPoints,
                                             " points remaining")});
    return;
  }

  const uint64_t offset = uint64_t(cursor.currentPos) * PointSize;
  const uint64_t expected = count * PointSize;
  std::byte* data = nullptr;
  const uint64_t bytesRead = file_.read(&data, offset, expected);
  if (bytesRead != expected) {
    view_.onProblem_(Status{
      StatusCode::Corrupt,
      internal::StrCat("failed to read expected chunk at position ", cursor.currentPos, " of \"",
                       view_.dataPath_, "\": expected ", expected, " bytes, read ", bytesRead)});
    return;
  }

  chunk_.positions.resize(count);
  chunk_.values.resize(count);
  for (uint64_t i = 0; i < count; ++i) {
    chunk_.positions[i] = cursor.currentPos + PointIndex(i);
    chunk_.values[i] = internal::ParseFloat32(data + i * PointSize);
  }
  chunkPos_ = cursor.currentPos;
  hasChunk_ = true;
}

ChunkView::Iterator::reference ChunkView::Iterator::Impl::dereference() const {
  return chunk_;
}

bool ChunkView::Iterator::Impl::has_value() const {
  return hasChunk_;
}

ChunkView::Iterator::reference ChunkView::Iterator::operator*() const {
  return impl_->dereference();
}

ChunkView::Iterator::pointer ChunkView::Iterator::operator->() const {
  return &impl_->dereference();
}

ChunkView::Iterator& ChunkView::Iterator::operator++() {
  impl_->increment();
  if (!impl_->has_value()) {
    impl_ = nullptr;
  }
  return *this;
}

void ChunkView::Iterator::operator++(int) {
  ++*this;
}

bool operator==(const ChunkView::Iterator& a, const ChunkView::Iterator& b) {
  return a.impl_ == b.impl_;
}

bool operator!=(const ChunkView::Iterator& a, const ChunkView::Iterator& b) {
  return !(a == b);
}

}  // namespace fina
