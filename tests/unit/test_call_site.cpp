/**
 * @file test_call_site.cpp
 * @brief Unit tests for caller-tag formatting
 */

#include <gtest/gtest.h>
#include <levelog/core/call_site.hpp>

#include <string>

using namespace levelog::core;

namespace {

CallSite site(const char* signature, const char* function, int line,
              const char* file = "src/app/worker.cpp") {
    CallSite s;
    s.file = file;
    s.function = function;
    s.signature = signature;
    s.line = line;
    return s;
}

}  // namespace

namespace app {

class Worker {
public:
    CallSite run() { return LEVELOG_CALL_SITE; }
};

template<typename T>
class Pool {
public:
    CallSite drain() { return LEVELOG_CALL_SITE; }
};

class Flag {
public:
    explicit operator bool() {
        captured = LEVELOG_CALL_SITE;
        return true;
    }

    CallSite captured;
};

}  // namespace app

CallSite globalHelper() {
    return LEVELOG_CALL_SITE;
}

TEST(CallSiteTest, MemberFunction) {
    EXPECT_EQ(callerTag(site("void Worker::run()", "run", 42)), "[Worker.run()]:42");
}

TEST(CallSiteTest, NamespacedMemberUsesInnermostScope) {
    EXPECT_EQ(callerTag(site("void app::Worker::run(int, const char*)", "run", 7)),
              "[Worker.run()]:7");
}

TEST(CallSiteTest, TemplateArgumentsRemoved) {
    EXPECT_EQ(callerTag(site("std::vector<int> Pool<T>::drain() [with T = Job]", "drain", 9)),
              "[Pool.drain()]:9");
    EXPECT_EQ(callerTag(site("void Pool<std::map<int, int> >::drain()", "drain", 9)),
              "[Pool.drain()]:9");
}

TEST(CallSiteTest, TemplateReturnTypeWithFunctionType) {
    EXPECT_EQ(callerTag(site("std::function<void()> Worker::callback()", "callback", 3)),
              "[Worker.callback()]:3");
}

TEST(CallSiteTest, LambdaAttributedToEnclosingFunction) {
    EXPECT_EQ(callerTag(site("Worker::run()::<lambda()>", "operator()", 12)),
              "[Worker.run()]:12");
}

TEST(CallSiteTest, CallOperator) {
    EXPECT_EQ(callerTag(site("void Task::operator()()", "operator()", 5)),
              "[Task.operator()()]:5");
}

TEST(CallSiteTest, ConversionOperator) {
    EXPECT_EQ(callerTag(site("Flag::operator bool()", "operator bool", 6)),
              "[Flag.operator bool()]:6");
    EXPECT_EQ(callerTag(site("app::Flag::operator std::string() const", "operator basic_string", 6)),
              "[Flag.operator std::string()]:6");
}

TEST(CallSiteTest, NamespaceNamedLikeOperator) {
    EXPECT_EQ(callerTag(site("void operators::Table::lookup()", "lookup", 4)),
              "[Table.lookup()]:4");
}

TEST(CallSiteTest, CurrentHasNoSignature) {
    CallSite s = CallSite::current("src/jobs/queue.cpp", "push", 21);

    EXPECT_TRUE(s.resolved());
    EXPECT_EQ(s.signature, nullptr);
    EXPECT_EQ(callerTag(s), "[queue.push()]:21");
}

TEST(CallSiteTest, FreeFunctionUsesFileStem) {
    EXPECT_EQ(callerTag(site("int main(int, char**)", "main", 17, "/build/src/daemon.cpp")),
              "[daemon.main()]:17");
}

TEST(CallSiteTest, AnonymousNamespaceUsesFileStem) {
    EXPECT_EQ(callerTag(site("void {anonymous}::helper()", "helper", 8)),
              "[worker.helper()]:8");
    EXPECT_EQ(callerTag(site("void (anonymous namespace)::helper()", "helper", 8)),
              "[worker.helper()]:8");
}

TEST(CallSiteTest, WithoutSignatureFallsBackToFunction) {
    EXPECT_EQ(callerTag(site(nullptr, "run", 3)), "[worker.run()]:3");
}

TEST(CallSiteTest, UnresolvedSiteGivesEmptyTag) {
    EXPECT_EQ(callerTag(CallSite{}), "");
    EXPECT_EQ(callerTag(site("void Worker::run()", "run", 0)), "");
}

TEST(CallSiteTest, SourceStem) {
    EXPECT_EQ(sourceStem("src/core/logger.cpp"), "logger");
    EXPECT_EQ(sourceStem("C:\\work\\main.cc"), "main");
    EXPECT_EQ(sourceStem("Makefile"), "Makefile");
    EXPECT_EQ(sourceStem(nullptr), "");
}

TEST(CallSiteTest, CapturedFromMemberFunction) {
    app::Worker worker;
    CallSite captured = worker.run();

    ASSERT_TRUE(captured.resolved());
    EXPECT_EQ(callerTag(captured), "[Worker.run()]:" + std::to_string(captured.line));
}

TEST(CallSiteTest, CapturedFromClassTemplate) {
    app::Pool<int> pool;
    CallSite captured = pool.drain();

    EXPECT_EQ(callerTag(captured), "[Pool.drain()]:" + std::to_string(captured.line));
}

TEST(CallSiteTest, CapturedFromConversionOperator) {
    app::Flag flag;
    ASSERT_TRUE(static_cast<bool>(flag));

    EXPECT_EQ(callerTag(flag.captured), "[Flag.operator bool()]:" + std::to_string(flag.captured.line));
}

TEST(CallSiteTest, CapturedFromFreeFunction) {
    CallSite captured = globalHelper();

    EXPECT_EQ(callerTag(captured), "[test_call_site.globalHelper()]:" + std::to_string(captured.line));
}
