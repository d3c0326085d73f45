#pragma once

#include "planner.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace fina {

/**
 * @brief An abstract interface for reading raw feed bytes.
 */
struct FINA_PUBLIC IReadable {
  virtual ~IReadable() = default;

  /**
   * @brief Returns the size of the file in bytes.
   */
  virtual uint64_t size() const = 0;
  /**
   * @brief Reads a portion of the file.
   *
   * @param output Updated to point at the requested bytes. The pointer and data must remain valid
   *   and unmodified until the next call to read().
   * @param offset The offset in bytes from the beginning of the file to read.
   * @param size The number of bytes to read.
   * @return uint64_t Number of bytes actually read. This may be less than the requested size if
   *   the end of the file is reached. If the read fails, this method should return 0.
   */
  virtual uint64_t read(std::byte** output, uint64_t offset, uint64_t size) = 0;
};

/**
 * @brief IReadable implementation wrapping a FILE* pointer created by fopen()
 * and a read buffer. The FILE* is not closed by this class.
 */
class FINA_PUBLIC FileReader final : public IReadable {
public:
  FileReader(std::FILE* file);

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  std::FILE* file_;
  std::vector<std::byte> buffer_;
  uint64_t size_;
  uint64_t position_;
};

/**
 * @brief IReadable implementation over a read-only memory mapping of a whole file. The mapping is
 * released by close() or on destruction.
 */
class FINA_PUBLIC MappedFile final : public IReadable {
public:
  MappedFile() = default;
  ~MappedFile() override;

  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  MappedFile(MappedFile&&) = delete;
  MappedFile& operator=(MappedFile&&) = delete;

  /**
   * @brief Maps `filename` read-only.
   *
   * @return Status StatusCode::NotFound if the file does not exist, StatusCode::OpenFailed or
   *   StatusCode::MapFailed on system errors.
   */
  Status open(const std::string& filename);
  void close();
  bool isOpen() const {
    return fd_ >= 0;
  }

  uint64_t size() const override;
  /**
   * @brief Points `output` directly into the mapping. Bytes past the current end of the file are
   * never returned, so a file truncated after open() yields a short read.
   */
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  int fd_ = -1;
  std::byte* data_ = nullptr;
  uint64_t size_ = 0;
};

/**
 * @brief Locates and parses the `.meta` and `.dat` pair of a feed inside a data directory.
 */
class FINA_PUBLIC MetaReader final {
public:
  MetaReader(std::string_view dataDir, const ReaderOptions& options = {});

  /**
   * @brief Builds `{dataDir}/{fileName}{extension}`.
   *
   * @return Status StatusCode::PathSecurity if the extension is not `.meta` or `.dat`, or if the
   *   normalized path leaves the data directory.
   */
  Status resolvePath(std::string_view fileName, std::string_view extension,
                     std::string* output) const;

  /**
   * @brief Reads a fresh FileMeta for `fileName`. Nothing is cached between calls.
   *
   * @return Status StatusCode::NotFound if either file is missing, StatusCode::SizeLimit if either
   *   file exceeds its configured limit, StatusCode::Corrupt for a short meta record, a data file
   *   that is not a whole number of points or inconsistent timestamps.
   */
  Status read(std::string_view fileName, FileMeta* output) const;

  /**
   * @brief Parses the meta record of `source` and derives the remaining fields from the size of
   * the data file.
   */
  static Status ParseMeta(IReadable& source, uint64_t dataSize, FileMeta* output);

  const std::string& dataDir() const {
    return dataDir_;
  }

private:
  std::string dataDir_;
  ReaderOptions options_;

  Status checkFile(const std::string& path, uint64_t limit, uint64_t* size) const;
};

/**
 * @brief A run of consecutive points read in one memory access.
 */
struct FINA_PUBLIC Chunk {
  std::vector<PointIndex> positions;
  std::vector<float> values;

  size_t size() const {
    return values.size();
  }
};

/**
 * @brief An iterable view of the chunks covering the remaining points of a ReadCursor. The data
 * file is mapped when iteration begins and unmapped when the last chunk has been consumed or the
 * iterator is destroyed. A view can be iterated only once.
 */
struct FINA_PUBLIC ChunkView {
  struct FINA_PUBLIC Iterator {
    using iterator_category = std::input_iterator_tag;
    using difference_type = int64_t;
    using value_type = Chunk;
    using pointer = const Chunk*;
    using reference = const Chunk&;

    reference operator*() const;
    pointer operator->() const;
    Iterator& operator++();
    void operator++(int);
    FINA_PUBLIC friend bool operator==(const Iterator& a, const Iterator& b);
    FINA_PUBLIC friend bool operator!=(const Iterator& a, const Iterator& b);

  private:
    friend ChunkView;

    Iterator() = default;
    Iterator(ChunkView& view);

    class Impl {
    public:
      Impl(ChunkView& view);

      Impl(const Impl&) = delete;
      Impl& operator=(const Impl&) = delete;
      Impl(Impl&&) = delete;
      Impl& operator=(Impl&&) = delete;

      void increment();
      reference dereference() const;
      bool has_value() const;

    private:
      void readChunk();

      ChunkView& view_;
      MappedFile file_;
      Chunk chunk_;
      PointIndex chunkPos_ = -1;
      bool hasChunk_ = false;
    };

    std::unique_ptr<Impl> impl_;
  };

  /**
   * @brief Creates a view over `dataPath`, driven by `cursor`.
   *
   * @param autoAdvance If true, `cursor` is advanced past each chunk before the next one is read.
   *   Otherwise the caller must call SearchPlanner::advance() between increments.
   * @param onProblem Called with the reason iteration stopped early.
   */
  ChunkView(std::string_view dataPath, const SearchPlanner& planner, const ReadPlan& plan,
            ReadCursor& cursor, bool autoAdvance, const ProblemCallback& onProblem);

  ChunkView(const ChunkView&) = delete;
  ChunkView& operator=(const ChunkView&) = delete;
  ChunkView(ChunkView&&) = default;
  ChunkView& operator=(ChunkView&&) = delete;

  Iterator begin();
  Iterator end();

private:
  std::string dataPath_;
  const SearchPlanner& planner_;
  const ReadPlan& plan_;
  ReadCursor& cursor_;
  bool autoAdvance_;
  bool begun_ = false;
  const ProblemCallback onProblem_;
};

}  // namespace fina

#ifdef FINA_IMPLEMENTATION
#  include "reader.inl"
#endif
