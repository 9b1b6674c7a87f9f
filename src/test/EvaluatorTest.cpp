#undef NDEBUG
#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "domain/audit/Evaluator.hpp"
#include "test/TestSupport.hpp"

using namespace scribeaudit::domain;
using namespace scribeaudit::domain::audit;
using namespace scribeaudit::domain::rules;
using scribeaudit::test::LinkSource;
using scribeaudit::test::MakeCourse;
using scribeaudit::test::MakeTranscript;

namespace {

std::vector<std::string> Names(const RuleVerdict& verdict) {
    std::vector<std::string> names;
    for (const auto& course : verdict.applied) {
        names.push_back(course.key.subject + " " + course.key.number);
    }
    return names;
}

BlockAuditResult EvaluateOne(const std::string& source, const Transcript& transcript, const std::string& blockId,
                             EvaluationPolicy policy = {}) {
    Evaluator run(transcript, LinkSource(source), std::move(policy));
    return run.Evaluate(blockId);
}

std::string Fingerprint(const RuleVerdict& verdict) {
    std::string text = std::to_string(verdict.node) + (verdict.satisfied ? "+" : "-") + "[";
    for (const auto& course : verdict.applied) text += std::to_string(course.transcriptIndex) + ",";
    text += "]" + verdict.shortfall + "{";
    for (const auto& child : verdict.children) text += Fingerprint(child) + ";";
    return text + "}";
}

void CollectLeafAllocations(const RuleVerdict& verdict, std::vector<std::size_t>& out) {
    if (verdict.kind == RuleKind::CourseSet) {
        for (const auto& course : verdict.applied) {
            if (!course.shared) out.push_back(course.transcriptIndex);
        }
        return;
    }
    for (const auto& child : verdict.children) CollectLeafAllocations(child, out);
}

} // namespace

static void TestCourseSetScenario() {
    std::cout << "[Test] Course set allocates earliest matching courses..." << std::endl;
    const Transcript transcript = MakeTranscript("S1", {
        MakeCourse("MATH", "101", "3", "A", "2020F"),
        MakeCourse("MATH", "201", "3", "A", "2021W"),
        MakeCourse("MATH", "150", "3", "B", "2021F"),
    });

    const auto result = EvaluateOne("block M courses MATH 100-199 min 2 courses", transcript, "M");
    assert(result.satisfied);
    assert((Names(result.root) == std::vector<std::string>{"MATH 101", "MATH 150"}));
    assert(result.root.appliedCount == 2);
    assert(result.root.appliedCredits == Credits::Whole(6));
    assert(result.root.shortfall.empty());
    assert(result.unconsumed.size() == 1);
    assert(result.unconsumed[0].key.number == "201");
    std::cout << "[PASS] Course set allocates earliest matching courses." << std::endl;
}

static void TestGroupShortfallScenario() {
    std::cout << "[Test] All-of group reports per-child shortfalls..." << std::endl;
    const Transcript transcript = MakeTranscript("S2", {
        MakeCourse("ENG", "101", "3", "A", "2020F"),
        MakeCourse("ENG", "102", "3", "B", "2021W"),
    });

    const auto result = EvaluateOne(
        "block H all-of { courses ENG* min 3 credits; courses HIST* min 3 credits }", transcript, "H");
    assert(!result.satisfied);
    assert(result.root.children.size() == 2);

    const RuleVerdict& eng = result.root.children[0];
    assert(eng.satisfied);
    assert((Names(eng) == std::vector<std::string>{"ENG 101"}));

    const RuleVerdict& hist = result.root.children[1];
    assert(!hist.satisfied);
    assert(hist.applied.empty());
    assert(hist.shortfall == "needs 3 credits from HIST*");
    assert(result.root.shortfall == "needs 1 more of 2 requirements");
    std::cout << "[PASS] All-of group reports per-child shortfalls." << std::endl;
}

static void TestShortfallWording() {
    std::cout << "[Test] Shortfall wording..." << std::endl;
    const Transcript transcript = MakeTranscript("S3", {
        MakeCourse("CHEM", "110", "3", "A", "2020F"),
    });

    auto result = EvaluateOne("block C courses CHEM 100-299 min 2 courses min 6 credits", transcript, "C");
    assert(result.root.shortfall == "needs 1 more course and 3 more credits from CHEM 100-299");

    result = EvaluateOne("block C courses CHEM 100-299 min 3 courses", transcript, "C");
    assert(result.root.shortfall == "needs 2 more courses from CHEM 100-299");

    result = EvaluateOne("block C courses BIO min 1 courses min 1 credits", transcript, "C");
    assert(result.root.shortfall == "needs 1 course and 1 credit from BIO");
    std::cout << "[PASS] Shortfall wording." << std::endl;
}

static void TestCandidateOrdering() {
    std::cout << "[Test] Candidate ordering by term, credits, position..." << std::endl;
    const Transcript transcript = MakeTranscript("S4", {
        MakeCourse("MATH", "130", "5", "A", "TRANSFER"),
        MakeCourse("MATH", "120", "3", "A", "2020F"),
        MakeCourse("MATH", "110", "4", "A", "2020F"),
        MakeCourse("MATH", "115", "4", "A", "2020F"),
        MakeCourse("MATH", "100", "3", "A", "2020SP"),
    });

    const auto result = EvaluateOne("block O courses MATH min 5 courses", transcript, "O");
    assert((Names(result.root) ==
            std::vector<std::string>{"MATH 100", "MATH 110", "MATH 115", "MATH 120", "MATH 130"}));
    std::cout << "[PASS] Candidate ordering by term, credits, position." << std::endl;
}

static void TestEligibilityAndGradeFloors() {
    std::cout << "[Test] Eligibility and grade floors..." << std::endl;
    const Transcript transcript = MakeTranscript("S5", {
        MakeCourse("BIO", "101", "4", "F", "2020F"),
        MakeCourse("BIO", "102", "4", "NP", "2020F"),
        MakeCourse("BIO", "103", "4", "IP", "2021W"),
        MakeCourse("BIO", "104", "4", "D", "2021W"),
        MakeCourse("BIO", "105", "4", "P", "2021F"),
        MakeCourse("BIO", "106", "4", "B+", "2021F"),
    });

    auto result = EvaluateOne("block B courses BIO min 6 courses", transcript, "B");
    assert((Names(result.root) == std::vector<std::string>{"BIO 104", "BIO 105", "BIO 106"}));

    EvaluationPolicy inProgress;
    inProgress.countInProgress = true;
    result = EvaluateOne("block B courses BIO min 6 courses", transcript, "B", inProgress);
    assert((Names(result.root) == std::vector<std::string>{"BIO 103", "BIO 104", "BIO 105", "BIO 106"}));

    result = EvaluateOne("block B courses BIO min 6 courses grade at-least C", transcript, "B");
    assert((Names(result.root) == std::vector<std::string>{"BIO 105", "BIO 106"}));

    EvaluationPolicy strict;
    strict.passMeetsGradeFloor = false;
    result = EvaluateOne("block B courses BIO min 6 courses grade at-least C", transcript, "B", strict);
    assert((Names(result.root) == std::vector<std::string>{"BIO 106"}));
    std::cout << "[PASS] Eligibility and grade floors." << std::endl;
}

static void TestNOfGroupPreference() {
    std::cout << "[Test] N-of group counting and preference..." << std::endl;
    const Transcript transcript = MakeTranscript("S6", {
        MakeCourse("PHYS", "101", "3", "A", "2020F"),
        MakeCourse("CHEM", "101", "4", "A", "2020F"),
        MakeCourse("BIO", "101", "5", "A", "2020F"),
    });
    const std::string source = "block N 2-of { courses PHYS; courses CHEM; courses BIO }";

    auto result = EvaluateOne(source, transcript, "N");
    assert(result.satisfied);
    assert(result.root.children[0].counted);
    assert(result.root.children[1].counted);
    assert(!result.root.children[2].counted);
    // Satisfied children beyond k keep their allocation.
    assert(result.root.children[2].appliedCount == 1);
    assert(result.root.appliedCount == 3);

    EvaluationPolicy byCredits;
    byCredits.groupPreference = GroupPreference::MostCredits;
    result = EvaluateOne(source, transcript, "N", byCredits);
    assert(!result.root.children[0].counted);
    assert(result.root.children[1].counted);
    assert(result.root.children[2].counted);

    result = EvaluateOne("block A any-of { courses ART; courses MUS }", transcript, "A");
    assert(!result.satisfied);
    assert(result.root.shortfall == "needs 1 more of 2 requirements");
    std::cout << "[PASS] N-of group counting and preference." << std::endl;
}

static void TestMaximumReleasesExcess() {
    std::cout << "[Test] Maximum releases excess back to the pool..." << std::endl;
    const Transcript transcript = MakeTranscript("S7", {
        MakeCourse("ART", "101", "3", "A", "2019F"),
        MakeCourse("ART", "102", "3", "A", "2020W"),
        MakeCourse("ART", "103", "3", "A", "2020F"),
        MakeCourse("ART", "104", "3", "A", "2021W"),
    });
    const std::string source =
        "block CAP all-of { maximum 6 credits courses ART* min 4 courses; courses ART* min 1 courses }";

    auto result = EvaluateOne(source, transcript, "CAP");
    const RuleVerdict& cap = result.root.children[0];
    assert(cap.appliedCredits == Credits::Whole(6));
    assert((Names(cap) == std::vector<std::string>{"ART 101", "ART 102"}));
    assert(!cap.satisfied);
    assert(cap.children[0].shortfall == "needs 2 more courses from ART*");
    assert(cap.shortfall == cap.children[0].shortfall);
    // Released courses are available to later siblings.
    assert((Names(result.root.children[1]) == std::vector<std::string>{"ART 103"}));
    assert(!result.satisfied);

    EvaluationPolicy oldestFirst;
    oldestFirst.releaseOrder = ReleaseOrder::OldestFirst;
    result = EvaluateOne(source, transcript, "CAP", oldestFirst);
    assert((Names(result.root.children[0]) == std::vector<std::string>{"ART 103", "ART 104"}));
    assert((Names(result.root.children[1]) == std::vector<std::string>{"ART 101"}));

    // Ceiling over a group: the group's satisfaction is recomputed after release.
    const Transcript mixed = MakeTranscript("S8", {
        MakeCourse("ART", "101", "3", "A", "2020F"),
        MakeCourse("ART", "102", "3", "A", "2020F"),
        MakeCourse("MUS", "101", "3", "A", "2020F"),
        MakeCourse("MUS", "102", "3", "A", "2020F"),
    });
    result = EvaluateOne(
        "block G maximum 6 credits all-of { courses ART* min 2 courses; courses MUS* min 2 courses }", mixed, "G");
    assert(result.root.appliedCredits == Credits::Whole(6));
    const RuleVerdict& group = result.root.children[0];
    assert(group.children[0].satisfied);
    assert(!group.children[1].satisfied);
    assert(group.children[1].shortfall == "needs 2 courses from MUS*");
    assert(group.shortfall == "needs 1 more of 2 requirements");
    assert(result.unconsumed.size() == 2);

    result = EvaluateOne("block U maximum 2 courses courses ART* min 1 courses", transcript, "U");
    assert(result.satisfied);
    assert(result.root.appliedCount == 1);
    std::cout << "[PASS] Maximum releases excess back to the pool." << std::endl;
}

static void TestConditional() {
    std::cout << "[Test] Conditional chooses exactly one branch..." << std::endl;
    const std::string source = "block IFB if total-credits >= 6 then courses MATH else courses ENG";

    const Transcript enough = MakeTranscript("S9", {
        MakeCourse("MATH", "101", "3", "A", "2020F"),
        MakeCourse("ENG", "101", "3", "A", "2020F"),
    });
    auto result = EvaluateOne(source, enough, "IFB");
    assert(result.root.branchTaken.has_value() && *result.root.branchTaken);
    assert(result.root.children.size() == 1);
    assert((Names(result.root) == std::vector<std::string>{"MATH 101"}));
    assert(result.unconsumed.size() == 1);

    const Transcript fewer = MakeTranscript("S10", {
        MakeCourse("ENG", "101", "3", "A", "2020F"),
    });
    result = EvaluateOne(source, fewer, "IFB");
    assert(!*result.root.branchTaken);
    assert(result.satisfied);
    assert((Names(result.root) == std::vector<std::string>{"ENG 101"}));

    // GPA = 23/7 = 3.2857...; compared exactly, not after rounding.
    const Transcript graded = MakeTranscript("S11", {
        MakeCourse("CS", "101", "3", "A", "2020F"),
        MakeCourse("CS", "102", "3", "B", "2020F"),
        MakeCourse("CS", "103", "1", "C", "2020F"),
    });
    result = EvaluateOne("block G if gpa >= 3.28 then courses CS else courses NONE", graded, "G");
    assert(*result.root.branchTaken);
    result = EvaluateOne("block G if gpa >= 3.29 then courses CS else courses NONE", graded, "G");
    assert(!*result.root.branchTaken);
    result = EvaluateOne(
        "block G if count-of(CS 100-199) = 3 and credits-of(CS*) < 7.5 then courses CS else courses NONE",
        graded, "G");
    assert(*result.root.branchTaken);

    Evaluator run(graded, nullptr);
    assert(run.aggregates().gpaHundredths() == 329);
    assert(run.aggregates().earnedCredits() == Credits::Whole(7));
    std::cout << "[PASS] Conditional chooses exactly one branch." << std::endl;
}

static void TestExclusiveReferencesAreMemoized() {
    std::cout << "[Test] Exclusive references consume once per run..." << std::endl;
    const Transcript transcript = MakeTranscript("S12", {
        MakeCourse("MATH", "101", "3", "A", "2020F"),
    });
    auto catalog = LinkSource(
        "block ROOT all-of { block-ref CORE; block-ref CORE }\n"
        "block CORE courses MATH min 1 courses");

    Evaluator run(transcript, catalog);
    const auto root = run.Evaluate("ROOT");
    assert(root.satisfied);
    assert(!root.root.children[0].memoized);
    assert(root.root.children[0].children.size() == 1);
    assert((Names(root.root.children[0]) == std::vector<std::string>{"MATH 101"}));
    assert(root.root.children[1].memoized);
    assert(root.root.children[1].satisfied);
    assert(root.root.children[1].applied.empty());
    assert(run.state().consumedCount() == 1);
    assert(run.state().owner(0)->blockId == "CORE");

    const auto core = run.Evaluate("CORE");
    assert(core.satisfied);
    assert(run.state().consumedCount() == 1);
    std::cout << "[PASS] Exclusive references consume once per run." << std::endl;
}

static void TestSharedAndExclusivePolicies() {
    std::cout << "[Test] Shared references do not consume..." << std::endl;
    const Transcript transcript = MakeTranscript("S13", {
        MakeCourse("MATH", "101", "3", "A", "2020F"),
    });

    auto shared = LinkSource(
        "block A all-of { courses MATH min 1 courses; block-ref B shared }\n"
        "block B courses MATH min 1 courses");
    Evaluator sharedRun(transcript, shared);
    const auto a = sharedRun.Evaluate("A");
    assert(a.satisfied);
    const RuleVerdict& ref = a.root.children[1];
    assert(ref.referencedBlock == "B");
    assert(ref.applied.size() == 1 && ref.applied[0].shared);
    assert(sharedRun.state().consumedCount() == 1);
    assert(sharedRun.state().owner(0)->blockId == "A");

    auto exclusive = LinkSource(
        "block A all-of { courses MATH min 1 courses; block-ref B }\n"
        "block B courses MATH min 1 courses");
    Evaluator exclusiveRun(transcript, exclusive);
    const auto e = exclusiveRun.Evaluate("A");
    assert(!e.satisfied);
    assert(e.root.children[1].shortfall == "block B is not satisfied");
    std::cout << "[PASS] Shared references do not consume." << std::endl;
}

static void TestUnresolvedReference() {
    std::cout << "[Test] Unlinked references raise EvaluationError..." << std::endl;
    const Transcript transcript = MakeTranscript("S14", {});
    const Block block = BlockParser().Parse("block A block-ref B").root;

    bool thrown = false;
    try {
        Evaluator run(transcript, nullptr);
        run.Evaluate(block);
    } catch (const EvaluationError& e) {
        thrown = true;
        assert(e.unresolvedBlock() == "B");
    }
    assert(thrown);

    thrown = false;
    try {
        Evaluator run(transcript, LinkSource("block A courses MATH"));
        run.Evaluate("NOPE");
    } catch (const EvaluationError&) {
        thrown = true;
    }
    assert(thrown);

    // Zero matching courses is a normal, fully unsatisfied result.
    Evaluator empty(transcript, LinkSource("block A all-of { courses MATH; courses ENG }"));
    const auto result = empty.Evaluate("A");
    assert(!result.satisfied);
    assert(result.root.shortfall == "needs 2 more of 2 requirements");
    std::cout << "[PASS] Unlinked references raise EvaluationError." << std::endl;
}

static void TestMaximumOverExclusiveReference() {
    std::cout << "[Test] Maximum caps courses consumed through a reference..." << std::endl;
    const Transcript transcript = MakeTranscript("S16", {
        MakeCourse("ART", "101", "3", "A", "2019F"),
        MakeCourse("ART", "102", "3", "A", "2020W"),
        MakeCourse("ART", "103", "3", "A", "2020F"),
    });
    auto catalog = LinkSource(
        "block A all-of { maximum 3 credits block-ref B; courses ART* min 1 courses }\n"
        "block B courses ART* min 3 courses\n"
        "block C maximum 3 credits all-of { block-ref B; block-ref B }");

    Evaluator run(transcript, catalog);
    const auto a = run.Evaluate("A");
    const RuleVerdict& cap = a.root.children[0];
    assert(cap.appliedCredits == Credits::Whole(3));
    assert((Names(cap) == std::vector<std::string>{"ART 101"}));
    const RuleVerdict& ref = cap.children[0];
    assert(!ref.satisfied);
    assert(ref.shortfall == "block B is not satisfied");
    assert(ref.children[0].shortfall == "needs 2 more courses from ART*");

    // The released course goes to the sibling.
    assert(a.root.children[1].satisfied);
    assert((Names(a.root.children[1]) == std::vector<std::string>{"ART 102"}));
    assert(run.state().consumedCount() == 2);
    assert(run.state().isConsumed(1));
    assert(!run.state().isConsumed(2));

    // The memoized block result reflects the cap and the current pool.
    const auto b = run.Evaluate("B");
    assert(!b.satisfied);
    assert((Names(b.root) == std::vector<std::string>{"ART 101"}));
    assert(b.unconsumed.size() == 1);
    assert(b.unconsumed[0].key.number == "103");

    // A second reference inside the same ceiling follows the capped verdict.
    Evaluator fresh(transcript, catalog);
    const auto c = fresh.Evaluate("C");
    assert(c.root.appliedCredits == Credits::Whole(3));
    const RuleVerdict& group = c.root.children[0];
    assert(!group.children[0].satisfied);
    assert(group.children[1].memoized);
    assert(!group.children[1].satisfied);
    assert(group.children[1].shortfall == "block B is not satisfied");
    std::cout << "[PASS] Maximum caps courses consumed through a reference." << std::endl;
}

static void TestRepeatedTopLevelEvaluation() {
    std::cout << "[Test] Re-evaluating a block reports the current pool..." << std::endl;
    const Transcript transcript = MakeTranscript("S17", {
        MakeCourse("MATH", "101", "3", "A", "2020F"),
        MakeCourse("ENG", "101", "3", "A", "2020F"),
    });
    Evaluator run(transcript, LinkSource(
        "block M courses MATH min 1 courses\n"
        "block E courses ENG min 1 courses"));

    const auto first = run.Evaluate("M");
    assert(first.unconsumed.size() == 1);
    run.Evaluate("E");
    const auto again = run.Evaluate("M");
    assert(again.satisfied);
    assert(again.unconsumed.empty());
    assert(Fingerprint(again.root) == Fingerprint(first.root));
    std::cout << "[PASS] Re-evaluating a block reports the current pool." << std::endl;
}

static void TestLowerCaseSubjects() {
    std::cout << "[Test] Subject patterns ignore letter case..." << std::endl;
    const Transcript transcript = MakeTranscript("S18", {
        MakeCourse("MATH", "101", "3", "A", "2020F"),
        MakeCourse("CHEM", "110", "3", "A", "2020F"),
    });
    auto result = EvaluateOne("block M courses math 100-199", transcript, "M");
    assert(result.satisfied);
    assert(result.root.description == "MATH 100-199");

    result = EvaluateOne("block C courses ch* except Chem 110", transcript, "C");
    assert(!result.satisfied);
    assert(result.root.shortfall == "needs 1 course from CH*");
    std::cout << "[PASS] Subject patterns ignore letter case." << std::endl;
}

static void TestIdempotenceAndConservation() {
    std::cout << "[Test] Idempotence and conservative consumption..." << std::endl;
    const Transcript transcript = MakeTranscript("S15", {
        MakeCourse("MATH", "101", "3", "A", "2019F"),
        MakeCourse("MATH", "151", "4", "B", "2020W"),
        MakeCourse("CS", "101", "3", "A", "2019F"),
        MakeCourse("CS", "201", "3", "C", "2020F"),
        MakeCourse("CS", "310", "3", "B", "2021W"),
        MakeCourse("CS", "320", "3", "A", "2021F"),
        MakeCourse("ENG", "110", "3", "P", "2019F"),
        MakeCourse("ART", "100", "2", "A", "2020F"),
    });
    auto catalog = LinkSource(
        "block MAJOR all-of {\n"
        "  courses MATH 100-199 min 2 courses;\n"
        "  courses CS 100-299 min 6 credits;\n"
        "  maximum 3 credits courses CS 300-399 min 2 courses;\n"
        "  1-of { courses CS*; courses MATH* };\n"
        "  block-ref GENED;\n"
        "  block-ref ANY shared\n"
        "}\n"
        "block GENED any-of { courses ENG*; courses ART* }\n"
        "block ANY courses * min 24 credits");

    Evaluator first(transcript, catalog);
    Evaluator second(transcript, catalog);
    const auto a = first.Evaluate("MAJOR");
    const auto b = second.Evaluate("MAJOR");
    assert(Fingerprint(a.root) == Fingerprint(b.root));

    std::vector<std::size_t> allocated;
    CollectLeafAllocations(a.root, allocated);
    const std::set<std::size_t> unique(allocated.begin(), allocated.end());
    assert(unique.size() == allocated.size());
    assert(unique.size() == first.state().consumedCount());

    Credits allocatedCredits;
    Credits transcriptCredits;
    for (std::size_t index : allocated) allocatedCredits += transcript.courses[index].credits;
    for (const auto& course : transcript.courses) transcriptCredits += course.credits;
    assert(allocatedCredits <= transcriptCredits);

    // The shared reference sees the whole transcript, consumed or not.
    const RuleVerdict& anyRef = a.root.children[5];
    assert(anyRef.satisfied);
    assert(anyRef.appliedCount == transcript.courses.size());
    std::cout << "[PASS] Idempotence and conservative consumption." << std::endl;
}

static void TestMonotonicity() {
    std::cout << "[Test] Adding a course keeps a satisfied block satisfied..." << std::endl;
    const std::string source =
        "block MONO all-of {\n"
        "  courses MATH 100-199 min 2 courses;\n"
        "  1-of { courses PHYS; courses CHEM };\n"
        "  maximum 2 courses courses ART* min 1 courses\n"
        "}";
    const std::vector<Course> base = {
        MakeCourse("MATH", "110", "3", "A", "2020F"),
        MakeCourse("MATH", "120", "3", "B", "2021W"),
        MakeCourse("CHEM", "101", "4", "A", "2020F"),
        MakeCourse("ART", "100", "2", "A", "2021W"),
    };
    const std::vector<Course> extras = {
        MakeCourse("MATH", "105", "3", "A", "2019F"),
        MakeCourse("PHYS", "101", "4", "B", "2022W"),
        MakeCourse("ART", "200", "3", "A", "2019F"),
        MakeCourse("ART", "210", "3", "A", "2019W"),
        MakeCourse("HIST", "101", "3", "A", "2020F"),
        MakeCourse("MATH", "199", "3", "F", "2020F"),
    };

    assert(EvaluateOne(source, MakeTranscript("M", base), "MONO").satisfied);
    std::vector<Course> growing = base;
    for (const auto& extra : extras) {
        std::vector<Course> single = base;
        single.push_back(extra);
        assert(EvaluateOne(source, MakeTranscript("M", single), "MONO").satisfied);
        growing.push_back(extra);
        assert(EvaluateOne(source, MakeTranscript("M", growing), "MONO").satisfied);
    }
    std::cout << "[PASS] Adding a course keeps a satisfied block satisfied." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Evaluator tests..." << std::endl;
    TestCourseSetScenario();
    TestGroupShortfallScenario();
    TestShortfallWording();
    TestCandidateOrdering();
    TestEligibilityAndGradeFloors();
    TestNOfGroupPreference();
    TestMaximumReleasesExcess();
    TestConditional();
    TestExclusiveReferencesAreMemoized();
    TestSharedAndExclusivePolicies();
    TestUnresolvedReference();
    TestMaximumOverExclusiveReference();
    TestRepeatedTopLevelEvaluation();
    TestLowerCaseSubjects();
    TestIdempotenceAndConservation();
    TestMonotonicity();
    std::cout << "[PASS] All Evaluator tests passed." << std::endl;
    return 0;
}
