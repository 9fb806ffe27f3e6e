#include "tfharvest/decoder.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <vector>

#include <lzma.h>
#include <nlohmann/json.hpp>
#include <zlib.h>

#include "tfharvest/common.hpp"

namespace tfharvest
{

static bool read_text_file_all(const std::string &path, std::string &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return static_cast<bool>(in) || in.eof();
}

static bool read_gz_file_all(const std::string &path, std::string &out)
{
    gzFile f = gzopen(path.c_str(), "rb");
    if (!f)
    {
        return false;
    }
    std::vector<char> buf(1 << 16);
    out.clear();
    while (true)
    {
        int got = gzread(f, buf.data(), static_cast<unsigned int>(buf.size()));
        if (got < 0)
        {
            gzclose(f);
            return false;
        }
        if (got == 0)
        {
            break;
        }
        out.append(buf.data(), static_cast<std::size_t>(got));
    }
    gzclose(f);
    return true;
}

static bool read_xz_file_all(const std::string &path, std::string &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return false;
    }
    out.clear();

    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK)
    {
        return false;
    }

    std::vector<std::uint8_t> in_buf(1 << 16);
    std::vector<std::uint8_t> out_buf(1 << 16);
    lzma_action action = LZMA_RUN;
    bool eof = false;
    bool ok = true;

    while (true)
    {
        if (strm.avail_in == 0 && !eof)
        {
            in.read(reinterpret_cast<char *>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
            std::streamsize got = in.gcount();
            strm.next_in = in_buf.data();
            strm.avail_in = static_cast<std::size_t>(got);
            if (got == 0)
            {
                eof = true;
                action = LZMA_FINISH;
            }
        }

        strm.next_out = out_buf.data();
        strm.avail_out = out_buf.size();

        lzma_ret ret = lzma_code(&strm, action);
        std::size_t produced = out_buf.size() - strm.avail_out;
        if (produced > 0)
        {
            out.append(reinterpret_cast<const char *>(out_buf.data()), produced);
        }

        if (ret == LZMA_STREAM_END)
        {
            break;
        }
        if (ret != LZMA_OK)
        {
            ok = false;
            break;
        }
        if (eof && strm.avail_in == 0 && produced == 0)
        {
            ok = false;
            break;
        }
    }

    lzma_end(&strm);
    return ok;
}

bool read_file_all(const std::string &path, std::string &out, std::string &err)
{
    bool ok = false;
    if (ends_with(path, ".gz"))
    {
        ok = read_gz_file_all(path, out);
    }
    else if (ends_with(path, ".xz"))
    {
        ok = read_xz_file_all(path, out);
    }
    else if (ends_with(path, ".bz2"))
    {
        err = "bzip2 feature files are not supported: " + path;
        return false;
    }
    else
    {
        ok = read_text_file_all(path, out);
    }
    if (!ok)
    {
        err = "failed to read feature file: " + path;
    }
    return ok;
}

static std::uint32_t page_number(const nlohmann::json &page, std::size_t fallback)
{
    auto it = page.find("seq");
    if (it != page.end())
    {
        if (it->is_number_unsigned())
        {
            return it->get<std::uint32_t>();
        }
        std::uint64_t v = 0;
        if (it->is_string() && parse_u64_arg(it->get<std::string>(), v))
        {
            return static_cast<std::uint32_t>(v);
        }
    }
    return static_cast<std::uint32_t>(fallback + 1);
}

static void append_section(const nlohmann::json &page, const char *section, std::uint32_t page_no,
                           std::vector<TokenPosCount> &out)
{
    auto sec = page.find(section);
    if (sec == page.end() || !sec->is_object())
    {
        return;
    }
    auto tpc = sec->find("tokenPosCount");
    if (tpc == sec->end() || !tpc->is_object())
    {
        return;
    }
    for (auto token_it = tpc->begin(); token_it != tpc->end(); ++token_it)
    {
        if (!token_it->is_object())
        {
            continue;
        }
        for (auto pos_it = token_it->begin(); pos_it != token_it->end(); ++pos_it)
        {
            if (!pos_it->is_number_integer())
            {
                continue;
            }
            out.push_back({page_no, token_it.key(), pos_it.key(), pos_it->get<std::int64_t>()});
        }
    }
}

FeatureFileDecoder::FeatureFileDecoder(FeatureDecodeOptions options) : options_(options) {}

bool FeatureFileDecoder::decode_document(const nlohmann::json &doc, Volume &out, std::string &err) const
{
    if (!doc.is_object())
    {
        err = "feature document is not a JSON object";
        return false;
    }

    auto id_it = doc.find("id");
    if (id_it == doc.end() || !id_it->is_string())
    {
        id_it = doc.find("htid");
    }
    if (id_it == doc.end() || !id_it->is_string() || id_it->get<std::string>().empty())
    {
        err = "feature document has no volume id";
        return false;
    }
    out.id = id_it->get<std::string>();

    out.language = SingleLanguage{};
    auto meta = doc.find("metadata");
    if (meta != doc.end() && meta->is_object())
    {
        auto lang = meta->find("language");
        if (lang != meta->end() && lang->is_string())
        {
            out.language = SingleLanguage{lang->get<std::string>()};
        }
        else if (lang != meta->end() && lang->is_array())
        {
            MultipleLanguages multiple;
            for (const auto &code : *lang)
            {
                if (code.is_string())
                {
                    multiple.codes.push_back(code.get<std::string>());
                }
            }
            out.language = std::move(multiple);
        }
    }

    auto features = doc.find("features");
    if (features == doc.end() || !features->is_object())
    {
        err = "feature document has no features section: " + out.id;
        return false;
    }
    auto pages = features->find("pages");
    if (pages == features->end() || !pages->is_array())
    {
        err = "feature document has no page list: " + out.id;
        return false;
    }

    out.token_pos_counts.clear();
    for (std::size_t i = 0; i < pages->size(); ++i)
    {
        const auto &page = (*pages)[i];
        if (!page.is_object())
        {
            continue;
        }
        std::uint32_t page_no = page_number(page, i);
        append_section(page, "body", page_no, out.token_pos_counts);
        if (options_.include_header_footer)
        {
            append_section(page, "header", page_no, out.token_pos_counts);
            append_section(page, "footer", page_no, out.token_pos_counts);
        }
    }
    return true;
}

bool FeatureFileDecoder::decode(const std::string &path, Volume &out, std::string &err) const
{
    std::string payload;
    if (!read_file_all(path, payload, err))
    {
        return false;
    }
    try
    {
        auto doc = nlohmann::json::parse(payload);
        return decode_document(doc, out, err);
    }
    catch (const nlohmann::json::exception &e)
    {
        err = "malformed feature file " + path + ": " + e.what();
        return false;
    }
}

} // namespace tfharvest
