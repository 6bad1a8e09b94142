#include "annotation.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace Hookstage;
using Hookstage::Testing::makeManifest;

TEST(AnnotationExtractorTest, MissingAnnotationYieldsEmptySet) {
    AnnotationExtractor extractor;
    EXPECT_TRUE(extractor.extract(makeManifest("ConfigMap", "settings")).empty());
}

TEST(AnnotationExtractorTest, ManifestWithoutMetadataYieldsEmptySet) {
    AnnotationExtractor extractor;
    Manifest manifest = ManifestLoader::parseDocument("kind: Secret\ndata: {}\n", "secret.yaml");
    EXPECT_TRUE(extractor.extract(manifest).empty());
}

TEST(AnnotationExtractorTest, EmptyAnnotationYieldsEmptySet) {
    AnnotationExtractor extractor;
    Manifest manifest = ManifestLoader::parseDocument(
        "kind: Job\nmetadata:\n  name: x\n  annotations:\n    hookstage.io/hook: \"\"\n", "x.yaml");
    EXPECT_TRUE(extractor.extract(manifest).empty());
    EXPECT_TRUE(extractor.parseValue("  , ,", "x").empty());
}

TEST(AnnotationExtractorTest, SinglePhase) {
    AnnotationExtractor extractor;
    auto phases = extractor.extract(makeManifest("Job", "migrate", "pre-install"));
    EXPECT_EQ(phases, std::set<Phase>({Phase::PreInstall}));
}

TEST(AnnotationExtractorTest, FullyValidListIsTrimmed) {
    AnnotationExtractor extractor;
    auto phases = extractor.extract(makeManifest("Job", "smoke", " post-install ,  post-upgrade,"));
    EXPECT_EQ(phases, std::set<Phase>({Phase::PostInstall, Phase::PostUpgrade}));
}

TEST(AnnotationExtractorTest, DuplicateEntriesCollapse) {
    AnnotationExtractor extractor;
    auto phases = extractor.parseValue("pre-delete,pre-delete", "dup");
    EXPECT_EQ(phases.size(), 1u);
}

TEST(AnnotationExtractorTest, PermissiveSkipsUnknownEntries) {
    AnnotationExtractor extractor("hookstage.io/hook", PhasePolicy::Permissive);
    auto phases = extractor.extract(makeManifest("Job", "mixed", "pre-install,pre-test,Post-Install"));
    EXPECT_EQ(phases, std::set<Phase>({Phase::PreInstall}));
}

TEST(AnnotationExtractorTest, StrictRejectsUnknownEntries) {
    AnnotationExtractor extractor("hookstage.io/hook", PhasePolicy::Strict);
    try {
        extractor.extract(makeManifest("Job", "mixed", "pre-install,pre-test"));
        FAIL() << "expected HookError";
    } catch (const HookError& e) {
        EXPECT_EQ(e.kind(), HookErrorKind::UnrecognizedPhase);
        EXPECT_NE(std::string(e.what()).find("pre-test"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("Job/mixed"), std::string::npos);
    }
}

TEST(AnnotationExtractorTest, StrictAcceptsFullyValidList) {
    AnnotationExtractor extractor("hookstage.io/hook", PhasePolicy::Strict);
    auto phases = extractor.extract(makeManifest("Job", "ok", "pre-rollback,post-rollback"));
    EXPECT_EQ(phases, std::set<Phase>({Phase::PreRollback, Phase::PostRollback}));
}

TEST(AnnotationExtractorTest, CustomAnnotationKey) {
    AnnotationExtractor extractor("example.com/phase");
    EXPECT_TRUE(extractor.extract(makeManifest("Job", "a", "pre-install")).empty());
    auto phases = extractor.extract(makeManifest("Job", "b", "pre-install", "example.com/phase"));
    EXPECT_EQ(phases, std::set<Phase>({Phase::PreInstall}));
}

TEST(AnnotationExtractorTest, FormatThenExtractPreservesSet) {
    AnnotationExtractor extractor;
    std::set<Phase> original = {Phase::PostUpgrade, Phase::PreDelete, Phase::PostInstall};

    std::string value = AnnotationExtractor::format(original);
    EXPECT_EQ(extractor.parseValue(value, "roundtrip"), original);
}

TEST(AnnotationExtractorTest, ListOrderDoesNotMatter) {
    AnnotationExtractor extractor;
    EXPECT_EQ(extractor.parseValue("post-install,pre-install", "a"),
              extractor.parseValue("pre-install,post-install", "b"));
}

TEST(AnnotationExtractorTest, ParsePhasePolicy) {
    EXPECT_EQ(parsePhasePolicy("strict"), PhasePolicy::Strict);
    EXPECT_EQ(parsePhasePolicy("permissive"), PhasePolicy::Permissive);
    EXPECT_THROW(parsePhasePolicy("lenient"), HookError);
}
