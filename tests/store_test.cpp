#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "tfharvest/column_store.hpp"
#include "test_support.hpp"

using namespace tfharvest;
using tfharvest::testing::TempDir;

static std::vector<DocsRow> docs_for(const std::string &id, int tokens)
{
    std::vector<DocsRow> rows;
    for (int i = 0; i < tokens; ++i)
    {
        rows.push_back({id, "tok" + std::to_string(i), i + 1});
    }
    return rows;
}

static std::vector<CorpusRow> corpus_for(int tokens)
{
    std::vector<CorpusRow> rows;
    for (int i = 0; i < tokens; ++i)
    {
        rows.push_back({"eng", "tok" + std::to_string(i), 2 * (i + 1)});
    }
    return rows;
}

static void flip_byte(const std::string &path, std::uint64_t offset)
{
    std::fstream f(path, std::ios::binary | std::ios::in | std::ios::out);
    f.seekg(static_cast<std::streamoff>(offset));
    char c = 0;
    f.read(&c, 1);
    c = static_cast<char>(c ^ 0xFF);
    f.seekp(static_cast<std::streamoff>(offset));
    f.write(&c, 1);
}

static void write_and_read_back()
{
    TempDir dir("store");
    const std::string path = dir.file("w0.tfs");
    StoreWriter writer(path);
    std::string err;

    assert(writer.append_batch({}, {}, err));
    assert(!std::filesystem::exists(path));

    assert(writer.append_batch(docs_for("mdp.001", 3), corpus_for(3), err));
    std::vector<DocsRow> second = docs_for("mdp.002", 2);
    second.push_back({"mdp.003", std::string(kTokenWidth, 'z'), 9});
    assert(writer.append_batch(second, {}, err));
    assert(writer.committed_batches() == 2);

    StoreReader reader;
    assert(reader.open(path, err));
    assert(reader.committed_batches() == 2);
    assert(reader.torn_tail_bytes() == 0);
    assert(reader.row_count(TableId::docs) == 6);
    assert(reader.row_count(TableId::corpus) == 3);
    assert(reader.blocks().size() == 4);

    auto docs_blocks = reader.table_blocks(TableId::docs);
    assert(docs_blocks.size() == 2);
    std::vector<DocsRow> rows;
    assert(reader.read_docs(*docs_blocks[1], rows, err));
    assert(rows.size() == 3);
    assert(rows[0].volume_id == "mdp.002" && rows[0].token == "tok0" && rows[0].count == 1);
    assert(rows[2].volume_id == "mdp.003" && rows[2].token.size() == kTokenWidth && rows[2].count == 9);

    auto corpus_blocks = reader.table_blocks(TableId::corpus);
    std::vector<CorpusRow> corpus;
    assert(reader.read_corpus(*corpus_blocks[0], corpus, err));
    assert(corpus.size() == 3);
    assert(corpus[2].language == "eng" && corpus[2].token == "tok2" && corpus[2].count == 6);
    assert(reader.read_corpus(*corpus_blocks[1], corpus, err));
    assert(corpus.empty());

    // Mismatched table.
    assert(!reader.read_corpus(*docs_blocks[0], corpus, err));
}

static void rejects_oversized_values()
{
    TempDir dir("store-width");
    const std::string path = dir.file("w0.tfs");
    StoreWriter writer(path);
    std::string err;
    assert(writer.append_batch(docs_for("mdp.001", 1), corpus_for(1), err));
    const auto size = std::filesystem::file_size(path);

    assert(!writer.append_batch({{std::string(kIdWidth + 1, 'a'), "x", 1}}, {}, err));
    assert(err.find("volume id") != std::string::npos);
    assert(!writer.append_batch({}, {{"eng", std::string(kTokenWidth + 1, 'b'), 1}}, err));
    assert(!writer.append_batch({}, {{"toolonglang", "x", 1}}, err));
    assert(std::filesystem::file_size(path) == size);
}

static void torn_tail_is_ignored_then_repaired()
{
    TempDir dir("store-torn");
    const std::string path = dir.file("w0.tfs");
    std::string err;
    std::uint64_t first_end = 0;
    {
        StoreWriter writer(path);
        assert(writer.append_batch(docs_for("mdp.001", 4), corpus_for(4), err));
        first_end = std::filesystem::file_size(path);
        assert(writer.append_batch(docs_for("mdp.002", 4), corpus_for(4), err));
    }
    const auto full = std::filesystem::file_size(path);

    // Cut the second batch in the middle of its data.
    std::filesystem::resize_file(path, first_end + (full - first_end) / 2);
    StoreReader reader;
    assert(reader.open(path, err));
    assert(reader.committed_batches() == 1);
    assert(reader.committed_bytes() == first_end);
    assert(reader.torn_tail_bytes() == (full - first_end) / 2);
    std::vector<DocsRow> rows;
    assert(reader.read_docs(*reader.table_blocks(TableId::docs)[0], rows, err));
    assert(rows.size() == 4 && rows[0].volume_id == "mdp.001");

    {
        StoreWriter writer(path);
        assert(writer.append_batch(docs_for("mdp.003", 2), corpus_for(2), err));
        assert(writer.repaired_tail_bytes() == (full - first_end) / 2);
        assert(writer.committed_batches() == 2);
    }
    assert(reader.open(path, err));
    assert(reader.committed_batches() == 2);
    assert(reader.torn_tail_bytes() == 0);
    assert(reader.row_count(TableId::docs) == 6);
    assert(reader.read_docs(*reader.table_blocks(TableId::docs)[1], rows, err));
    assert(rows[0].volume_id == "mdp.003");

    // Preallocated zeros after the last commit count as a torn tail as well.
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        std::string zeros(300, '\0');
        out.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
    }
    assert(reader.open(path, err));
    assert(reader.committed_batches() == 2);
    assert(reader.torn_tail_bytes() == 300);
}

static void corruption_is_structural()
{
    TempDir dir("store-corrupt");
    const std::string path = dir.file("w0.tfs");
    std::string err;
    {
        StoreWriter writer(path);
        assert(writer.append_batch(docs_for("mdp.001", 20), corpus_for(20), err));
        assert(writer.append_batch(docs_for("mdp.002", 20), corpus_for(20), err));
    }

    StoreReader reader;
    assert(reader.open(path, err));
    const BlockInfo first = reader.blocks()[0];

    // Payload damage shows up when the column is read.
    const std::string copy = dir.file("payload.tfs");
    std::filesystem::copy_file(path, copy);
    flip_byte(copy, first.offset + sizeof(BlockHeader) + first.header.compressed_bytes[0] + 2);
    StoreReader damaged;
    assert(damaged.open(copy, err));
    std::vector<DocsRow> rows;
    err.clear();
    assert(!damaged.read_docs(damaged.blocks()[0], rows, err));
    assert(!err.empty());

    // Header damage inside committed data fails the open.
    flip_byte(path, first.offset + 24);
    err.clear();
    assert(!reader.open(path, err));
    assert(err.find("checksum") != std::string::npos);

    // So does something that is not a store at all, and the writer refuses it.
    const std::string junk = dir.file("junk.tfs");
    tfharvest::testing::write_file(junk, "definitely not a store file");
    err.clear();
    assert(!reader.open(junk, err));
    StoreWriter writer(junk);
    err.clear();
    assert(!writer.append_batch(docs_for("mdp.009", 1), corpus_for(1), err));
    assert(tfharvest::testing::read_file(junk) == "definitely not a store file");
}

static void lists_store_files()
{
    TempDir dir("store-list");
    tfharvest::testing::write_file(dir.file("b.tfs"), "");
    tfharvest::testing::write_file(dir.file("a.tfs"), "");
    tfharvest::testing::write_file(dir.file("run_summary.json"), "{}");
    auto files = list_store_files(dir.path().string());
    assert(files.size() == 2);
    assert(std::filesystem::path(files[0]).filename() == "a.tfs");
    assert(list_store_files(dir.file("missing")).empty());
}

int main()
{
    write_and_read_back();
    rejects_oversized_values();
    torn_tail_is_ignored_then_repaired();
    corruption_is_structural();
    lists_store_files();
    return 0;
}
