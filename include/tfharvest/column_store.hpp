#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tfharvest
{

inline constexpr std::size_t kIdWidth = 25;
inline constexpr std::size_t kLanguageWidth = 8;
inline constexpr std::size_t kTokenWidth = 50;

inline constexpr const char *kDocsTableName = "/tf/docs";
inline constexpr const char *kCorpusTableName = "/tf/corpus";
inline constexpr const char *kStoreFileExtension = ".tfs";

enum class TableId : std::uint32_t
{
    docs = 1,
    corpus = 2
};

const char *table_name(TableId table);

struct DocsRow
{
    std::string volume_id;
    std::string token;
    std::int64_t count = 0;
};

struct CorpusRow
{
    std::string language;
    std::string token;
    std::int64_t count = 0;
};

// On-disk layout: StoreFileHeader, then for every batch one BlockHeader plus
// three zlib-compressed column segments per table, closed by a CommitRecord.
// Blocks without a following commit are not part of the store.
struct StoreFileHeader
{
    std::uint32_t magic = 0x31534654; // "TFS1"
    std::uint32_t version = 1;
};

inline constexpr std::size_t kColumnCount = 3;

struct BlockHeader
{
    std::uint32_t magic = 0x4B4C4254; // "TBLK"
    std::uint32_t table_id = 0;
    std::uint32_t key_width = 0;
    std::uint32_t token_width = 0;
    std::uint64_t row_count = 0;
    std::uint64_t raw_bytes[kColumnCount] = {0, 0, 0};
    std::uint64_t compressed_bytes[kColumnCount] = {0, 0, 0};
    std::uint32_t column_crc[kColumnCount] = {0, 0, 0};
    std::uint32_t header_crc = 0;
};

struct CommitRecord
{
    std::uint32_t magic = 0x544D4D43; // "CMMT"
    std::uint32_t block_count = 0;
    std::uint64_t batch_seq = 0;
    std::uint64_t docs_rows = 0;
    std::uint64_t corpus_rows = 0;
    std::uint64_t batch_bytes = 0;
    std::uint32_t crc = 0;
    std::uint32_t reserved = 0;
};

static_assert(sizeof(StoreFileHeader) == 8, "store header layout");
static_assert(sizeof(BlockHeader) == 88, "block header layout");
static_assert(sizeof(CommitRecord) == 48, "commit record layout");

// Where a batch's two table appends go. The writer below is the real one;
// tests substitute failing implementations.
class BatchStore
{
  public:
    virtual ~BatchStore() = default;

    // All or nothing: on false, neither table holds any of the rows.
    virtual bool append_batch(const std::vector<DocsRow> &docs, const std::vector<CorpusRow> &corpus,
                              std::string &err) = 0;
};

class StoreWriter final : public BatchStore
{
  public:
    explicit StoreWriter(std::string path);

    // Creates the file on first use. A torn, uncommitted tail left by an
    // earlier writer is cut off before the first append.
    bool append_batch(const std::vector<DocsRow> &docs, const std::vector<CorpusRow> &corpus,
                      std::string &err) override;

    const std::string &path() const
    {
        return path_;
    }
    std::uint64_t committed_batches() const
    {
        return next_seq_;
    }
    std::uint64_t repaired_tail_bytes() const
    {
        return repaired_tail_bytes_;
    }

  private:
    bool prepare(std::string &err);
    bool write_batch(const std::vector<char> &bytes, std::string &err);
    void rollback(std::string &err);

    std::string path_;
    bool prepared_ = false;
    std::uint64_t committed_size_ = 0;
    std::uint64_t next_seq_ = 0;
    std::uint64_t repaired_tail_bytes_ = 0;
};

struct BlockInfo
{
    TableId table = TableId::docs;
    std::uint64_t offset = 0; // of the BlockHeader
    std::uint64_t batch_seq = 0;
    BlockHeader header;
};

class StoreReader
{
  public:
    // Indexes committed blocks. Fails on structural corruption inside the
    // file; a truncated or zero-filled tail is only reported.
    bool open(const std::string &path, std::string &err);

    const std::string &path() const
    {
        return path_;
    }
    const std::vector<BlockInfo> &blocks() const
    {
        return blocks_;
    }
    std::vector<const BlockInfo *> table_blocks(TableId table) const;
    std::uint64_t row_count(TableId table) const;
    std::uint64_t committed_batches() const
    {
        return committed_batches_;
    }
    std::uint64_t committed_bytes() const
    {
        return committed_bytes_;
    }
    std::uint64_t torn_tail_bytes() const
    {
        return torn_tail_bytes_;
    }

    // Column 0 is the key (volume id or language), 1 the token.
    bool read_string_column(const BlockInfo &block, std::size_t column, std::vector<std::string> &out,
                            std::string &err) const;
    bool read_count_column(const BlockInfo &block, std::vector<std::int64_t> &out, std::string &err) const;

    bool read_docs(const BlockInfo &block, std::vector<DocsRow> &out, std::string &err) const;
    bool read_corpus(const BlockInfo &block, std::vector<CorpusRow> &out, std::string &err) const;

  private:
    bool read_column_raw(const BlockInfo &block, std::size_t column, std::vector<char> &raw, std::string &err) const;

    std::string path_;
    std::vector<BlockInfo> blocks_;
    std::uint64_t committed_batches_ = 0;
    std::uint64_t committed_bytes_ = 0;
    std::uint64_t torn_tail_bytes_ = 0;
};

// Sorted *.tfs files directly under dir.
std::vector<std::string> list_store_files(const std::string &dir);

} // namespace tfharvest
