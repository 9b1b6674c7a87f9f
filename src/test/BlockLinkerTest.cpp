#undef NDEBUG
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "domain/rules/BlockLinker.hpp"
#include "domain/rules/BlockParser.hpp"

using namespace scribeaudit::domain;
using namespace scribeaudit::domain::rules;

namespace {

std::vector<std::shared_ptr<const Block>> ParseAll(const std::vector<std::string>& sources) {
    BlockParser parser;
    std::vector<std::shared_ptr<const Block>> blocks;
    for (std::size_t i = 0; i < sources.size(); ++i) {
        for (auto& block : parser.Parse(sources[i], "source" + std::to_string(i)).allBlocks()) {
            blocks.push_back(std::make_shared<const Block>(std::move(block)));
        }
    }
    return blocks;
}

LinkError ExpectLinkError(const std::vector<std::string>& sources) {
    try {
        BlockLinker::Link(ParseAll(sources));
    } catch (const LinkError& e) {
        return e;
    }
    assert(false && "expected LinkError");
    return LinkError(std::vector<LinkIssue>{});
}

} // namespace

static void TestResolvesReferences() {
    std::cout << "[Test] Resolves references..." << std::endl;
    auto catalog = BlockLinker::Link(ParseAll({
        "block MAJOR all-of { block-ref CORE; block-ref ELECTIVES shared }",
        "block CORE courses CS 101\nblock ELECTIVES courses CS 300-499 min 2 courses",
    }));
    assert(catalog->size() == 3);
    assert(catalog->find("CORE") != nullptr);
    assert(catalog->find("ELECTIVES")->sourceId == "source1");
    assert(catalog->find("NOPE") == nullptr);

    auto refs = BlockLinker::ReferencesOf(*catalog->find("MAJOR"));
    assert(refs.size() == 2);
    assert(refs[0].target == "CORE");
    assert(refs[0].policy == SharePolicy::Exclusive);
    assert(refs[1].target == "ELECTIVES");
    assert(refs[1].policy == SharePolicy::Shared);
    std::cout << "[PASS] Resolves references." << std::endl;
}

static void TestMissingTargets() {
    std::cout << "[Test] Missing targets reported per reference..." << std::endl;
    LinkError e = ExpectLinkError({"block MAJOR all-of {\n  block-ref GHOST;\n  block-ref PHANTOM\n}"});
    assert(e.issues().size() == 2);
    assert(e.issues()[0].kind == LinkIssue::Kind::MissingBlock);
    assert(e.issues()[0].blockId == "MAJOR");
    assert(e.issues()[0].target == "GHOST");
    assert(e.issues()[0].position.line == 2);
    assert(e.issues()[1].target == "PHANTOM");
    assert(e.issues()[1].position.line == 3);
    std::cout << "[PASS] Missing targets reported per reference." << std::endl;
}

static void TestCycles() {
    std::cout << "[Test] Cycles detected at link time..." << std::endl;
    LinkError e = ExpectLinkError({"block A block-ref B\nblock B block-ref A"});
    assert(e.issues().size() == 1);
    const LinkIssue& issue = e.issues()[0];
    assert(issue.kind == LinkIssue::Kind::CycleDetected);
    assert((issue.cycle == std::vector<std::string>{"A", "B", "A"}));
    assert(std::string(e.what()).find("A -> B -> A") != std::string::npos);

    LinkError self = ExpectLinkError({"block LOOP all-of { courses MATH; block-ref LOOP shared }"});
    assert(self.issues().size() == 1);
    assert((self.issues()[0].cycle == std::vector<std::string>{"LOOP", "LOOP"}));

    LinkError longer = ExpectLinkError({"block X block-ref Y", "block Y block-ref Z", "block Z block-ref X"});
    assert(longer.issues().size() == 1);
    assert(longer.issues()[0].cycle.size() == 4);
    assert(longer.issues()[0].cycle.front() == "X");
    std::cout << "[PASS] Cycles detected at link time." << std::endl;
}

static void TestDuplicatesAcrossSources() {
    std::cout << "[Test] Duplicate ids across sources..." << std::endl;
    LinkError e = ExpectLinkError({"block CORE courses MATH", "block CORE courses ENG"});
    assert(e.issues().size() == 1);
    assert(e.issues()[0].kind == LinkIssue::Kind::DuplicateBlock);
    assert(e.issues()[0].target == "CORE");
    std::cout << "[PASS] Duplicate ids across sources." << std::endl;
}

static void TestDiamondIsNotACycle() {
    std::cout << "[Test] Diamond references link..." << std::endl;
    auto catalog = BlockLinker::Link(ParseAll({
        "block TOP all-of { block-ref LEFT; block-ref RIGHT }\n"
        "block LEFT block-ref BASE shared\n"
        "block RIGHT block-ref BASE shared\n"
        "block BASE courses MATH",
    }));
    assert(catalog->size() == 4);
    std::cout << "[PASS] Diamond references link." << std::endl;
}

int main() {
    std::cout << "[Test] Starting BlockLinker tests..." << std::endl;
    TestResolvesReferences();
    TestMissingTargets();
    TestCycles();
    TestDuplicatesAcrossSources();
    TestDiamondIsNotACycle();
    std::cout << "[PASS] All BlockLinker tests passed." << std::endl;
    return 0;
}
