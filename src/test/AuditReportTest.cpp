#undef NDEBUG
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "application/AuditReportBuilder.hpp"
#include "application/AuditService.hpp"
#include "application/BlockCatalogService.hpp"
#include "application/ReportExportService.hpp"
#include "test/TestSupport.hpp"

using namespace scribeaudit::application;
using namespace scribeaudit::domain;
using namespace scribeaudit::domain::audit;
using scribeaudit::test::MakeCourse;
using scribeaudit::test::MakeTranscript;

namespace {

const char* k_programSource =
    "block CORE \"Core\" core all-of {\n"
    "  label \"Calculus\" courses MATH 100-199 min 2 courses;\n"
    "  label \"Writing\" courses ENG* min 3 credits\n"
    "}\n"
    "block ELECT \"Electives\" other any-of {\n"
    "  label \"History\" courses HIST* min 6 credits;\n"
    "  label \"Art\" courses ART* min 2 courses\n"
    "}\n";

Transcript SampleTranscript() {
    return MakeTranscript("S-100", {
        MakeCourse("MATH", "101", "3", "A", "2020F"),
        MakeCourse("MATH", "150", "3", "B", "2021W"),
        MakeCourse("ENG", "101", "3", "C", "2020F"),
        MakeCourse("HIST", "201", "3", "A", "2021F"),
        MakeCourse("CHEM", "101", "4", "F", "2021F"),
        MakeCourse("PHYS", "101", "4", "IP", "2022W"),
    });
}

std::shared_ptr<BlockCatalogService> BuildCatalog(const std::string& source) {
    auto catalog = std::make_shared<BlockCatalogService>();
    catalog->Upsert("program.block", source);
    catalog->Rebuild();
    return catalog;
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

static void TestReportSummary() {
    std::cout << "[Test] Report summarizes blocks, shortfalls and unused courses..." << std::endl;
    AuditService service(BuildCatalog(k_programSource));
    const AuditReport report = service.Audit(SampleTranscript(), {"CORE", "ELECT"});

    assert(report.studentId == "S-100");
    assert(!report.satisfied);
    assert((report.satisfiedBlocks == std::vector<std::string>{"CORE"}));
    assert((report.unsatisfiedBlocks == std::vector<std::string>{"ELECT"}));
    assert(report.blocks.size() == 2);
    assert(report.blocks[0].blockId == "CORE");
    assert(report.blocks[0].root.appliedCredits == Credits::Whole(9));

    assert(report.shortfalls.size() == 3);
    assert(report.shortfalls[0].blockId == "ELECT");
    assert(report.shortfalls[0].label == "any of 2");
    assert(report.shortfalls[0].text == "needs 1 more of 2 requirements");
    assert(report.shortfalls[1].label == "History");
    assert(report.shortfalls[1].text == "needs 3 more credits from HIST*");
    assert(report.shortfalls[2].label == "Art");
    assert(report.shortfalls[2].text == "needs 2 courses from ART*");

    // HIST 201 is applied even though its block is unmet; the failed and in-progress courses never are.
    assert(report.unusedCourses.size() == 2);
    assert(report.unusedCourses[0].key.subject == "CHEM");
    assert(report.unusedCourses[1].key.subject == "PHYS");

    assert(report.totals.courseCount == 6);
    assert(report.totals.earnedCredits == Credits::Whole(12));
    // (4*3 + 3*3 + 2*3 + 4*3 + 0*4) / 16 = 2.4375
    assert(report.totals.gpaHundredths == 244);
    std::cout << "[PASS] Report summarizes blocks, shortfalls and unused courses." << std::endl;
}

static void TestBlockOrderDecidesAllocation() {
    std::cout << "[Test] Earlier blocks get first pick of courses..." << std::endl;
    AuditService service(BuildCatalog(
        "block A courses MATH min 1 courses\n"
        "block B courses MATH min 1 courses\n"));
    const Transcript transcript = MakeTranscript("S-200", {MakeCourse("MATH", "101", "3", "A", "2020F")});

    auto report = service.Audit(transcript, {"A", "B"});
    assert((report.satisfiedBlocks == std::vector<std::string>{"A"}));
    report = service.Audit(transcript, {"B", "A"});
    assert((report.satisfiedBlocks == std::vector<std::string>{"B"}));
    assert(report.unusedCourses.empty());
    std::cout << "[PASS] Earlier blocks get first pick of courses." << std::endl;
}

static void TestReferenceShortfallsStayWithTheirBlock() {
    std::cout << "[Test] Shortfalls do not descend into references..." << std::endl;
    AuditService service(BuildCatalog(
        "block MAIN all-of { block-ref SUB }\n"
        "block SUB courses XYZ min 2 courses\n"));
    const auto report = service.Audit(MakeTranscript("S-300", {}), {"MAIN"});

    assert(report.shortfalls.size() == 2);
    assert(report.shortfalls[0].text == "needs 1 more of 1 requirements");
    assert(report.shortfalls[1].text == "block SUB is not satisfied");
    assert(report.shortfalls[1].label == "block SUB (exclusive)");
    std::cout << "[PASS] Shortfalls do not descend into references." << std::endl;
}

static void TestAuditWithoutCatalog() {
    std::cout << "[Test] Audit before the first rebuild fails..." << std::endl;
    AuditService service(std::make_shared<BlockCatalogService>());
    bool thrown = false;
    try {
        service.Audit(SampleTranscript(), {"CORE"});
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] Audit before the first rebuild fails." << std::endl;
}

static void TestJsonExport() {
    std::cout << "[Test] JSON export field names..." << std::endl;
    AuditService service(BuildCatalog(k_programSource));
    const auto report = service.Audit(SampleTranscript(), {"CORE", "ELECT"});
    const nlohmann::json j = ReportExportService::ToJson(report);

    assert(j["studentId"] == "S-100");
    assert(j["satisfied"] == false);
    assert(j["unsatisfiedBlocks"].size() == 1);
    assert(j["shortfalls"].size() == 3);
    assert(j["shortfalls"][1]["label"] == "History");
    assert(j["unusedCourses"][0]["grade"] == "F");
    assert(j["totals"]["courses"] == 6);
    assert(j["totals"]["earnedCredits"].get<double>() == 12.0);

    const auto& core = j["blocks"][0];
    assert(core["id"] == "CORE");
    assert(core["type"] == "core");
    assert(core["root"]["kind"] == rules::RuleKindToString(rules::RuleKind::Group));
    assert(core["root"]["children"].size() == 2);
    assert(core["root"]["children"][0]["label"] == "Calculus");
    assert(core["root"]["children"][0]["applied"].size() == 2);
    assert(core["root"]["children"][0]["applied"][0]["display"] == "MATH 101 (2020F)");
    assert(!core["root"].contains("branch"));

    const auto parsed = nlohmann::json::parse(ReportExportService::Render(report, ReportFormat::Json));
    assert(parsed == j);
    std::cout << "[PASS] JSON export field names." << std::endl;
}

static void TestMarkdownExport() {
    std::cout << "[Test] Markdown export tables..." << std::endl;
    AuditService service(BuildCatalog(k_programSource));
    const auto report = service.Audit(SampleTranscript(), {"CORE", "ELECT"});
    const std::string md = ReportExportService::Render(report, ReportFormat::Markdown);

    assert(Contains(md, "# Degree Audit: S-100\n"));
    assert(Contains(md, "| Block | Title | Type | Status | Applied credits |\n"));
    assert(Contains(md, "| CORE | Core | core | satisfied | 9 |\n"));
    assert(Contains(md, "| ELECT | Electives | other | unsatisfied | 3 |\n"));
    assert(Contains(md, "## Outstanding\n"));
    assert(Contains(md, "| ELECT | History | needs 3 more credits from HIST* |\n"));
    assert(Contains(md, "## Unused Courses\n"));
    assert(Contains(md, "| CHEM 101 (2021F) | 4 | F |\n"));
    assert(Contains(md, "- [x] all of 2\n"));
    assert(Contains(md, "  - [x] **Calculus** MATH 100-199: MATH 101 (2020F), MATH 150 (2021W)\n"));
    assert(Contains(md, "  - [ ] **Art** ART* _(not counted)_ (needs 2 courses from ART*)\n"));
    assert(ReportFormatExtension(ReportFormat::Markdown) == ".md");
    std::cout << "[PASS] Markdown export tables." << std::endl;
}

int main() {
    std::cout << "[Test] Starting AuditReport tests..." << std::endl;
    TestReportSummary();
    TestBlockOrderDecidesAllocation();
    TestReferenceShortfallsStayWithTheirBlock();
    TestAuditWithoutCatalog();
    TestJsonExport();
    TestMarkdownExport();
    std::cout << "[PASS] All AuditReport tests passed." << std::endl;
    return 0;
}
