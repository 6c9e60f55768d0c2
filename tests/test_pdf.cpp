#include <catch2/catch.hpp>
#include <algorithm>
#include "paperback.hpp"
#include "pdf.hpp"
#include "test_helpers.hpp"

using paperback::Bytes;
using paperback::PageFormat;

namespace {

std::string as_text(const Bytes& b) { return std::string(b.begin(), b.end()); }

size_t count_of(const std::string& hay, const std::string& needle) {
    size_t n = 0;
    for (size_t p = hay.find(needle); p != std::string::npos; p = hay.find(needle, p + 1)) ++n;
    return n;
}

// Fixed checkerboard standing in for a real code generator.
class CheckerRenderer : public paperback::SymbolRenderer {
public:
    int calls = 0;
    unsigned last_version = 0;
    bool render(const std::string&, unsigned version, std::vector<unsigned char>& modules, unsigned& side) override {
        ++calls;
        last_version = version;
        side = paperback::symbol_modules(version);
        modules.assign(static_cast<size_t>(side) * side, 0);
        for (unsigned r = 0; r < side; ++r)
            for (unsigned c = 0; c < side; ++c) modules[r * side + c] = (r + c) % 2 == 0;
        return true;
    }
};

class BrokenRenderer : public paperback::SymbolRenderer {
public:
    bool render(const std::string&, unsigned, std::vector<unsigned char>&, unsigned&) override { return false; }
};

} // namespace

TEST_CASE("rendered PDF embeds every record in page order") {
    Bytes data = testutil::random_bytes(520, 201);
    paperback::Backup b = paperback::make_backup(data, "pdf test", 100, PageFormat::A4);
    Bytes pdf = paperback::render_pdf(b.pages, PageFormat::A4, nullptr);
    std::string text = as_text(pdf);

    REQUIRE(paperback::looks_like_pdf(pdf));
    REQUIRE(text.compare(0, 9, "%PDF-1.4\n") == 0);
    REQUIRE(text.substr(text.size() - 6) == "%%EOF\n");
    REQUIRE(text.find("/Count 7") != std::string::npos);
    REQUIRE(count_of(text, "/Type /Page ") == 7);
    REQUIRE(text.find("/MediaBox [0 0 595.280 841.890]") != std::string::npos);
    REQUIRE(text.find("(page 7)") != std::string::npos);

    std::vector<std::string> recs = paperback::read_records_from_pdf(pdf);
    REQUIRE(recs.size() == 6);
    for (size_t i = 0; i < recs.size(); ++i) REQUIRE(recs[i] == b.pages[i + 1].payload);

    paperback::ReconstructionSession s;
    for (const auto& r : recs) s.ingest(r);
    REQUIRE(s.assemble() == data);
}

TEST_CASE("xref offsets point at their objects") {
    paperback::Backup b = paperback::make_backup(testutil::bytes_of("xref"), "", 50, PageFormat::Letter);
    std::string text = as_text(paperback::render_pdf(b.pages, PageFormat::Letter, nullptr));
    size_t xref = text.find("\nxref\n");
    REQUIRE(xref != std::string::npos);
    ++xref;
    size_t start = std::stoul(text.substr(text.rfind("startxref\n") + 10));
    REQUIRE(start == xref);
    // entry for object 1 follows the free entry
    size_t entry = text.find("0000000000 65535 f \n", xref) + 20;
    size_t off1 = std::stoul(text.substr(entry, 10));
    REQUIRE(text.compare(off1, 8, "1 0 obj\n") == 0);
}

TEST_CASE("caption text is escaped") {
    paperback::Backup b = paperback::make_backup(testutil::bytes_of("x"), "a(b)c\\d", 50, PageFormat::A4);
    std::string text = as_text(paperback::render_pdf(b.pages, PageFormat::A4, nullptr));
    REQUIRE(text.find("a\\(b\\)c\\\\d") != std::string::npos);
}

TEST_CASE("symbol renderer output is drawn as modules") {
    paperback::Backup b = paperback::make_backup(testutil::random_bytes(200, 202), "", 100, PageFormat::A4);
    CheckerRenderer r;
    std::string text = as_text(paperback::render_pdf(b.pages, PageFormat::A4, &r));
    REQUIRE(r.calls == 2);
    REQUIRE(r.last_version == b.pages[1].symbol.version);
    REQUIRE(text.find(" re\n") != std::string::npos);
    REQUIRE(text.find("BT /F2 ") == std::string::npos);
    REQUIRE(paperback::read_records_from_pdf(std::vector<unsigned char>(text.begin(), text.end())).size() == 2);
}

TEST_CASE("record text is printed when no code can be drawn") {
    paperback::Backup b = paperback::make_backup(testutil::random_bytes(200, 203), "", 100, PageFormat::A4);
    BrokenRenderer broken;
    std::string with_broken = as_text(paperback::render_pdf(b.pages, PageFormat::A4, &broken));
    std::string without = as_text(paperback::render_pdf(b.pages, PageFormat::A4, nullptr));
    REQUIRE(with_broken == without);
    REQUIRE(without.find("BT /F2 ") != std::string::npos);
    REQUIRE(without.find(b.pages[1].payload.substr(0, 20)) != std::string::npos);
}

TEST_CASE("damaged PDF yields the intact records") {
    paperback::Backup b = paperback::make_backup(testutil::random_bytes(300, 204), "", 100, PageFormat::A4);
    Bytes pdf = paperback::render_pdf(b.pages, PageFormat::A4, nullptr);
    std::string text = as_text(pdf);
    size_t last = text.rfind("/Type /PaperbackRecord");
    REQUIRE(last != std::string::npos);
    Bytes cut(pdf.begin(), pdf.begin() + last + 60);
    REQUIRE(paperback::read_records_from_pdf(cut).size() == 2);
    REQUIRE(paperback::read_records_from_pdf(testutil::bytes_of("%PDF-1.4\nnothing")).empty());
    REQUIRE_FALSE(paperback::looks_like_pdf(testutil::bytes_of("PB2|")));
}
