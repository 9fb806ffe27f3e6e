#include "tfharvest/column_store.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <utility>

#include <zlib.h>

namespace tfharvest
{

namespace
{

constexpr std::uint32_t kBlockMagic = 0x4B4C4254;
constexpr std::uint32_t kCommitMagic = 0x544D4D43;

std::uint32_t checksum(const void *data, std::size_t n)
{
    return static_cast<std::uint32_t>(
        crc32(0L, reinterpret_cast<const Bytef *>(data), static_cast<uInt>(n)));
}

std::uint32_t header_checksum(BlockHeader h)
{
    h.header_crc = 0;
    return checksum(&h, sizeof(h));
}

std::uint32_t commit_checksum(CommitRecord c)
{
    c.crc = 0;
    return checksum(&c, sizeof(c));
}

template <typename T> void append_pod(std::vector<char> &out, const T &value)
{
    const char *p = reinterpret_cast<const char *>(&value);
    out.insert(out.end(), p, p + sizeof(T));
}

bool append_fixed(std::vector<char> &col, const std::string &value, std::size_t width, const char *what,
                  std::string &err)
{
    if (value.size() > width)
    {
        err = std::string(what) + " exceeds " + std::to_string(width) + " bytes: " + value;
        return false;
    }
    col.insert(col.end(), value.begin(), value.end());
    col.insert(col.end(), width - value.size(), '\0');
    return true;
}

using Columns = std::array<std::vector<char>, kColumnCount>;

bool append_block(TableId table, std::uint32_t key_width, std::uint64_t rows, const Columns &columns,
                  std::vector<char> &out, std::string &err)
{
    BlockHeader header;
    header.table_id = static_cast<std::uint32_t>(table);
    header.key_width = key_width;
    header.token_width = static_cast<std::uint32_t>(kTokenWidth);
    header.row_count = rows;

    std::array<std::vector<Bytef>, kColumnCount> compressed;
    for (std::size_t c = 0; c < kColumnCount; ++c)
    {
        const auto &raw = columns[c];
        header.raw_bytes[c] = raw.size();
        header.column_crc[c] = checksum(raw.data(), raw.size());
        if (raw.empty())
        {
            continue;
        }
        uLongf dst_bound = compressBound(static_cast<uLong>(raw.size()));
        compressed[c].resize(dst_bound);
        uLongf compressed_size = dst_bound;
        int zret = compress2(compressed[c].data(), &compressed_size, reinterpret_cast<const Bytef *>(raw.data()),
                             static_cast<uLong>(raw.size()), Z_BEST_SPEED);
        if (zret != Z_OK)
        {
            err = std::string("failed to compress ") + table_name(table) + " column " + std::to_string(c);
            return false;
        }
        compressed[c].resize(compressed_size);
        header.compressed_bytes[c] = compressed_size;
    }
    header.header_crc = header_checksum(header);

    append_pod(out, header);
    for (const auto &segment : compressed)
    {
        out.insert(out.end(), segment.begin(), segment.end());
    }
    return true;
}

bool encode_docs(const std::vector<DocsRow> &rows, std::vector<char> &out, std::string &err)
{
    Columns columns;
    columns[0].reserve(rows.size() * kIdWidth);
    columns[1].reserve(rows.size() * kTokenWidth);
    columns[2].reserve(rows.size() * sizeof(std::int64_t));
    for (const auto &row : rows)
    {
        if (!append_fixed(columns[0], row.volume_id, kIdWidth, "volume id", err) ||
            !append_fixed(columns[1], row.token, kTokenWidth, "token", err))
        {
            return false;
        }
        append_pod(columns[2], row.count);
    }
    return append_block(TableId::docs, static_cast<std::uint32_t>(kIdWidth), rows.size(), columns, out, err);
}

bool encode_corpus(const std::vector<CorpusRow> &rows, std::vector<char> &out, std::string &err)
{
    Columns columns;
    columns[0].reserve(rows.size() * kLanguageWidth);
    columns[1].reserve(rows.size() * kTokenWidth);
    columns[2].reserve(rows.size() * sizeof(std::int64_t));
    for (const auto &row : rows)
    {
        if (!append_fixed(columns[0], row.language, kLanguageWidth, "language", err) ||
            !append_fixed(columns[1], row.token, kTokenWidth, "token", err))
        {
            return false;
        }
        append_pod(columns[2], row.count);
    }
    return append_block(TableId::corpus, static_cast<std::uint32_t>(kLanguageWidth), rows.size(), columns, out,
                        err);
}

bool tail_is_zero_filled(std::ifstream &in, std::uint64_t from, std::uint64_t size)
{
    in.clear();
    in.seekg(static_cast<std::streamoff>(from));
    std::vector<char> buf(1 << 16);
    std::uint64_t left = size - from;
    while (left > 0)
    {
        std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(left, buf.size()));
        in.read(buf.data(), static_cast<std::streamsize>(n));
        if (!in)
        {
            return false;
        }
        if (std::any_of(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n), [](char c) { return c != 0; }))
        {
            return false;
        }
        left -= n;
    }
    return true;
}

} // namespace

const char *table_name(TableId table)
{
    return table == TableId::docs ? kDocsTableName : kCorpusTableName;
}

StoreWriter::StoreWriter(std::string path) : path_(std::move(path)) {}

bool StoreWriter::prepare(std::string &err)
{
    std::error_code ec;
    std::filesystem::path p(path_);
    if (p.has_parent_path())
    {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec)
        {
            err = "failed to create store dir: " + p.parent_path().string();
            return false;
        }
    }

    std::uint64_t committed = 0;
    const bool existing = std::filesystem::exists(p, ec);
    if (ec)
    {
        err = "failed to stat store file: " + path_ + " (" + ec.message() + ")";
        return false;
    }
    if (existing)
    {
        StoreReader reader;
        if (!reader.open(path_, err))
        {
            return false;
        }
        committed = reader.committed_bytes();
        next_seq_ = reader.committed_batches();
        if (committed >= sizeof(StoreFileHeader) && reader.torn_tail_bytes() > 0)
        {
            std::filesystem::resize_file(p, committed, ec);
            if (ec)
            {
                err = "failed to cut torn tail of " + path_ + ": " + ec.message();
                return false;
            }
            repaired_tail_bytes_ = reader.torn_tail_bytes();
        }
    }

    if (committed < sizeof(StoreFileHeader))
    {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            err = "failed to create store file: " + path_;
            return false;
        }
        StoreFileHeader header;
        out.write(reinterpret_cast<const char *>(&header), sizeof(header));
        out.flush();
        if (!out)
        {
            err = "failed to write store header: " + path_;
            return false;
        }
        committed = sizeof(StoreFileHeader);
        next_seq_ = 0;
    }

    committed_size_ = committed;
    prepared_ = true;
    return true;
}

void StoreWriter::rollback(std::string &err)
{
    std::error_code ec;
    std::filesystem::resize_file(path_, committed_size_, ec);
    if (ec)
    {
        err += "; rollback failed: " + ec.message();
    }
}

bool StoreWriter::write_batch(const std::vector<char> &bytes, std::string &err)
{
    {
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        if (!out)
        {
            err = "failed to open store for append: " + path_;
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out)
        {
            err = "failed to write store batch: " + path_;
            return false;
        }
    }
    std::error_code ec;
    std::uint64_t size = std::filesystem::file_size(path_, ec);
    if (ec || size != committed_size_ + bytes.size())
    {
        err = "store size mismatch after append: " + path_;
        return false;
    }
    return true;
}

bool StoreWriter::append_batch(const std::vector<DocsRow> &docs, const std::vector<CorpusRow> &corpus,
                               std::string &err)
{
    if (docs.empty() && corpus.empty())
    {
        return true;
    }

    // Encode before touching the file so bad rows never reach it.
    std::vector<char> bytes;
    if (!encode_docs(docs, bytes, err) || !encode_corpus(corpus, bytes, err))
    {
        return false;
    }

    if (!prepared_ && !prepare(err))
    {
        return false;
    }

    CommitRecord commit;
    commit.block_count = 2;
    commit.batch_seq = next_seq_;
    commit.docs_rows = docs.size();
    commit.corpus_rows = corpus.size();
    commit.batch_bytes = bytes.size();
    commit.crc = commit_checksum(commit);
    append_pod(bytes, commit);

    if (!write_batch(bytes, err))
    {
        rollback(err);
        return false;
    }
    committed_size_ += bytes.size();
    ++next_seq_;
    return true;
}

bool StoreReader::open(const std::string &path, std::string &err)
{
    path_ = path;
    blocks_.clear();
    committed_batches_ = 0;
    committed_bytes_ = 0;
    torn_tail_bytes_ = 0;

    std::error_code ec;
    const std::uint64_t size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        err = "failed to stat store file: " + path;
        return false;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        err = "failed to open store file: " + path;
        return false;
    }
    if (size < sizeof(StoreFileHeader))
    {
        torn_tail_bytes_ = size;
        return true;
    }

    StoreFileHeader file_header;
    in.read(reinterpret_cast<char *>(&file_header), sizeof(file_header));
    if (!in || file_header.magic != StoreFileHeader{}.magic || file_header.version != StoreFileHeader{}.version)
    {
        err = "not a store file: " + path;
        return false;
    }

    std::uint64_t offset = sizeof(StoreFileHeader);
    committed_bytes_ = offset;
    std::vector<BlockInfo> pending;

    auto torn = [&]() {
        torn_tail_bytes_ = size - committed_bytes_;
        return true;
    };
    auto corrupt = [&](const std::string &what) {
        if (tail_is_zero_filled(in, offset, size))
        {
            return torn();
        }
        err = what + " at offset " + std::to_string(offset) + " in " + path;
        return false;
    };

    while (offset < size)
    {
        if (size - offset < sizeof(std::uint32_t))
        {
            return torn();
        }
        in.clear();
        in.seekg(static_cast<std::streamoff>(offset));
        std::uint32_t magic = 0;
        in.read(reinterpret_cast<char *>(&magic), sizeof(magic));
        in.seekg(static_cast<std::streamoff>(offset));
        if (!in)
        {
            err = "failed to read store file: " + path;
            return false;
        }

        if (magic == kBlockMagic)
        {
            if (size - offset < sizeof(BlockHeader))
            {
                return torn();
            }
            BlockInfo info;
            in.read(reinterpret_cast<char *>(&info.header), sizeof(BlockHeader));
            if (!in)
            {
                err = "failed to read block header in " + path;
                return false;
            }
            if (header_checksum(info.header) != info.header.header_crc)
            {
                return corrupt("block header checksum mismatch");
            }
            if (info.header.table_id != static_cast<std::uint32_t>(TableId::docs) &&
                info.header.table_id != static_cast<std::uint32_t>(TableId::corpus))
            {
                return corrupt("unknown table id " + std::to_string(info.header.table_id));
            }
            std::uint64_t payload = 0;
            for (std::size_t c = 0; c < kColumnCount; ++c)
            {
                payload += info.header.compressed_bytes[c];
            }
            if (size - offset - sizeof(BlockHeader) < payload)
            {
                return torn();
            }
            info.table = static_cast<TableId>(info.header.table_id);
            info.offset = offset;
            info.batch_seq = committed_batches_;
            pending.push_back(info);
            offset += sizeof(BlockHeader) + payload;
        }
        else if (magic == kCommitMagic)
        {
            if (size - offset < sizeof(CommitRecord))
            {
                return torn();
            }
            CommitRecord commit;
            in.read(reinterpret_cast<char *>(&commit), sizeof(commit));
            if (!in)
            {
                err = "failed to read commit record in " + path;
                return false;
            }
            if (commit_checksum(commit) != commit.crc)
            {
                return corrupt("commit record checksum mismatch");
            }
            std::uint64_t docs_rows = 0;
            std::uint64_t corpus_rows = 0;
            for (const auto &b : pending)
            {
                (b.table == TableId::docs ? docs_rows : corpus_rows) += b.header.row_count;
            }
            if (commit.block_count != pending.size() || commit.docs_rows != docs_rows ||
                commit.corpus_rows != corpus_rows || commit.batch_seq != committed_batches_)
            {
                return corrupt("commit record does not match its blocks");
            }
            blocks_.insert(blocks_.end(), pending.begin(), pending.end());
            pending.clear();
            ++committed_batches_;
            offset += sizeof(CommitRecord);
            committed_bytes_ = offset;
        }
        else
        {
            return corrupt("unexpected record");
        }
    }
    torn_tail_bytes_ = size - committed_bytes_;
    return true;
}

std::vector<const BlockInfo *> StoreReader::table_blocks(TableId table) const
{
    std::vector<const BlockInfo *> out;
    for (const auto &b : blocks_)
    {
        if (b.table == table)
        {
            out.push_back(&b);
        }
    }
    return out;
}

std::uint64_t StoreReader::row_count(TableId table) const
{
    std::uint64_t n = 0;
    for (const auto &b : blocks_)
    {
        if (b.table == table)
        {
            n += b.header.row_count;
        }
    }
    return n;
}

bool StoreReader::read_column_raw(const BlockInfo &block, std::size_t column, std::vector<char> &raw,
                                  std::string &err) const
{
    const BlockHeader &h = block.header;
    const std::uint64_t widths[kColumnCount] = {h.key_width, h.token_width, sizeof(std::int64_t)};
    if (h.raw_bytes[column] != h.row_count * widths[column])
    {
        err = "column size does not match row count in " + path_;
        return false;
    }
    raw.assign(static_cast<std::size_t>(h.raw_bytes[column]), '\0');
    if (raw.empty())
    {
        return true;
    }

    std::uint64_t pos = block.offset + sizeof(BlockHeader);
    for (std::size_t c = 0; c < column; ++c)
    {
        pos += h.compressed_bytes[c];
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in)
    {
        err = "failed to open store file: " + path_;
        return false;
    }
    std::vector<Bytef> compressed(static_cast<std::size_t>(h.compressed_bytes[column]));
    in.seekg(static_cast<std::streamoff>(pos));
    in.read(reinterpret_cast<char *>(compressed.data()), static_cast<std::streamsize>(compressed.size()));
    if (!in)
    {
        err = "failed to read column data in " + path_;
        return false;
    }

    uLongf out_size = static_cast<uLongf>(raw.size());
    int zret = uncompress(reinterpret_cast<Bytef *>(raw.data()), &out_size, compressed.data(),
                          static_cast<uLong>(compressed.size()));
    if (zret != Z_OK || out_size != raw.size())
    {
        err = "failed to decompress column data in " + path_;
        return false;
    }
    if (checksum(raw.data(), raw.size()) != h.column_crc[column])
    {
        err = "column checksum mismatch in " + path_;
        return false;
    }
    return true;
}

bool StoreReader::read_string_column(const BlockInfo &block, std::size_t column, std::vector<std::string> &out,
                                     std::string &err) const
{
    if (column > 1)
    {
        err = "not a string column: " + std::to_string(column);
        return false;
    }
    std::vector<char> raw;
    if (!read_column_raw(block, column, raw, err))
    {
        return false;
    }
    const std::size_t width = column == 0 ? block.header.key_width : block.header.token_width;
    out.clear();
    out.reserve(static_cast<std::size_t>(block.header.row_count));
    for (std::size_t i = 0; i < block.header.row_count; ++i)
    {
        const char *cell = raw.data() + i * width;
        out.emplace_back(cell, strnlen(cell, width));
    }
    return true;
}

bool StoreReader::read_count_column(const BlockInfo &block, std::vector<std::int64_t> &out, std::string &err) const
{
    std::vector<char> raw;
    if (!read_column_raw(block, 2, raw, err))
    {
        return false;
    }
    out.resize(static_cast<std::size_t>(block.header.row_count));
    if (!out.empty())
    {
        std::memcpy(out.data(), raw.data(), raw.size());
    }
    return true;
}

bool StoreReader::read_docs(const BlockInfo &block, std::vector<DocsRow> &out, std::string &err) const
{
    if (block.table != TableId::docs)
    {
        err = "block is not part of " + std::string(kDocsTableName);
        return false;
    }
    std::vector<std::string> ids;
    std::vector<std::string> tokens;
    std::vector<std::int64_t> counts;
    if (!read_string_column(block, 0, ids, err) || !read_string_column(block, 1, tokens, err) ||
        !read_count_column(block, counts, err))
    {
        return false;
    }
    out.clear();
    out.reserve(ids.size());
    for (std::size_t i = 0; i < ids.size(); ++i)
    {
        out.push_back({std::move(ids[i]), std::move(tokens[i]), counts[i]});
    }
    return true;
}

bool StoreReader::read_corpus(const BlockInfo &block, std::vector<CorpusRow> &out, std::string &err) const
{
    if (block.table != TableId::corpus)
    {
        err = "block is not part of " + std::string(kCorpusTableName);
        return false;
    }
    std::vector<std::string> langs;
    std::vector<std::string> tokens;
    std::vector<std::int64_t> counts;
    if (!read_string_column(block, 0, langs, err) || !read_string_column(block, 1, tokens, err) ||
        !read_count_column(block, counts, err))
    {
        return false;
    }
    out.clear();
    out.reserve(langs.size());
    for (std::size_t i = 0; i < langs.size(); ++i)
    {
        out.push_back({std::move(langs[i]), std::move(tokens[i]), counts[i]});
    }
    return true;
}

std::vector<std::string> list_store_files(const std::string &dir)
{
    std::vector<std::string> out;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec); !ec && it != std::filesystem::directory_iterator();
         it.increment(ec))
    {
        if (it->is_regular_file() && it->path().extension() == kStoreFileExtension)
        {
            out.push_back(it->path().string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace tfharvest
