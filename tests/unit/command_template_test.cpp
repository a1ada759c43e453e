#include <gtest/gtest.h>

#include "models/command_template.h"

using namespace lswitch;

TEST(CommandTemplateTest, SubstitutesBracedPlaceholders) {
    auto out = substituteCommand("llama-server -m m.gguf --port ${PORT} -c ${CTX} --host ${HOST}",
                                 TemplateValues{8123, 4096, "0.0.0.0"});

    EXPECT_EQ(out.command, "llama-server -m m.gguf --port 8123 -c 4096 --host 0.0.0.0");
    EXPECT_TRUE(out.has_port);
    EXPECT_TRUE(out.has_ctx);
    EXPECT_TRUE(out.has_host);
    EXPECT_TRUE(out.unresolved.empty());
    EXPECT_TRUE(out.complete());
}

TEST(CommandTemplateTest, SubstitutesBareForms) {
    auto out = substituteCommand("server --port $PORT --ctx-size $CTX --host $HOST",
                                 TemplateValues{9000, 2048, "localhost"});

    EXPECT_EQ(out.command, "server --port 9000 --ctx-size 2048 --host localhost");
    EXPECT_TRUE(out.complete());
}

TEST(CommandTemplateTest, ReplacesEveryOccurrence) {
    auto out = substituteCommand("a ${PORT} b ${PORT} c $PORT", TemplateValues{7, 1, "h"});
    EXPECT_EQ(out.command, "a 7 b 7 c 7");
}

TEST(CommandTemplateTest, MissingPortPlaceholderIsIncomplete) {
    auto out = substituteCommand("llama-server -m model.gguf -c ${CTX}", TemplateValues{8000, 512, "h"});

    EXPECT_EQ(out.command, "llama-server -m model.gguf -c 512");
    EXPECT_FALSE(out.has_port);
    EXPECT_TRUE(out.has_ctx);
    EXPECT_FALSE(out.complete());
}

TEST(CommandTemplateTest, ReportsUnknownPlaceholders) {
    auto out = substituteCommand("run --port ${PORT} --model ${MODEL_DIR}/x.gguf --t ${THREADS}",
                                 TemplateValues{8000, 512, "h"});

    EXPECT_EQ(out.command, "run --port 8000 --model ${MODEL_DIR}/x.gguf --t ${THREADS}");
    ASSERT_EQ(out.unresolved.size(), 2u);
    EXPECT_EQ(out.unresolved[0], "MODEL_DIR");
    EXPECT_EQ(out.unresolved[1], "THREADS");
    EXPECT_FALSE(out.complete());
}

TEST(CommandTemplateTest, LeavesOtherShellSyntaxAlone) {
    const std::string tmpl = "FOO=1 exec server --port ${PORT} 2>&1 | tee \"$LOGFILE\"";
    auto out = substituteCommand(tmpl, TemplateValues{1234, 1, "h"});

    EXPECT_EQ(out.command, "FOO=1 exec server --port 1234 2>&1 | tee \"$LOGFILE\"");
}

TEST(CommandTemplateTest, FindPlaceholdersIgnoresUnterminated) {
    auto names = findPlaceholders("${A} ${B ${C}");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "A");
    EXPECT_EQ(names[1], "B ${C");
    EXPECT_TRUE(findPlaceholders("${open").empty());
}
