#include <gtest/gtest.h>

#include <string>

#include "codechunk_core/chunking/context_extractor.hpp"

namespace codechunk_core {

class ContextExtractorTest : public ::testing::Test {
 protected:
  ChunkerConfig config_;
  ContextExtractor extractor_{config_};
};

TEST_F(ContextExtractorTest, Python_ClassAndFunction) {
  std::string text =
      "class Repository:\n"
      "    pass\n"
      "\n"
      "def load_all(path):\n"
      "    return []\n";

  ChunkMetadata metadata = extractor_.extract(text, "python");

  EXPECT_EQ(metadata.class_name, "Repository");
  EXPECT_EQ(metadata.function_name, "load_all");
}

TEST_F(ContextExtractorTest, Python_AsyncFunction) {
  ChunkMetadata metadata = extractor_.extract("async def fetch(url):\n    pass\n", "python");

  EXPECT_FALSE(metadata.class_name.has_value());
  EXPECT_EQ(metadata.function_name, "fetch");
}

TEST_F(ContextExtractorTest, JavaScript_ExportedClassAndFunction) {
  std::string text =
      "export class Widget {\n"
      "}\n"
      "export async function render(node) {\n"
      "}\n";

  ChunkMetadata metadata = extractor_.extract(text, "javascript");

  EXPECT_EQ(metadata.class_name, "Widget");
  EXPECT_EQ(metadata.function_name, "render");
}

TEST_F(ContextExtractorTest, TypeScriptUsesJavaScriptPatterns) {
  ChunkMetadata metadata = extractor_.extract("function parse(input: string) {\n}\n", "typescript");

  EXPECT_EQ(metadata.function_name, "parse");
}

TEST_F(ContextExtractorTest, Java_ClassAndMethod) {
  std::string text =
      "public final class OrderService {\n"
      "    public static List<Order> findOrders(int customerId) {\n"
      "        return repository.find(customerId);\n"
      "    }\n"
      "}\n";

  ChunkMetadata metadata = extractor_.extract(text, "java");

  EXPECT_EQ(metadata.class_name, "OrderService");
  EXPECT_EQ(metadata.function_name, "findOrders");
}

TEST_F(ContextExtractorTest, Java_MethodFragmentWithoutClass) {
  std::string text =
      "    // Totals the basket\n"
      "    private synchronized double total(List<Item> items) {\n"
      "        return 0;\n"
      "    }\n";

  ChunkMetadata metadata = extractor_.extract(text, "java");

  EXPECT_FALSE(metadata.class_name.has_value());
  EXPECT_EQ(metadata.function_name, "total");
}

TEST_F(ContextExtractorTest, KotlinAndCSharpUseJavaLikePatterns) {
  std::string text = "public class Account {\n    public void close() {\n    }\n}\n";

  EXPECT_EQ(extractor_.extract(text, "kotlin").class_name, "Account");
  EXPECT_EQ(extractor_.extract(text, "c_sharp").function_name, "close");
}

TEST_F(ContextExtractorTest, Go_FunctionsAndReceivers) {
  EXPECT_EQ(extractor_.extract("func main() {\n}\n", "go").function_name, "main");

  ChunkMetadata method = extractor_.extract("func (s *Server) Start() error {\n}\n", "go");
  EXPECT_EQ(method.function_name, "Start");
  EXPECT_FALSE(method.class_name.has_value());
}

TEST_F(ContextExtractorTest, Rust_StructAndFunction) {
  std::string text =
      "pub struct Config {\n"
      "    name: String,\n"
      "}\n"
      "\n"
      "pub fn load() -> Config {\n"
      "}\n";

  ChunkMetadata metadata = extractor_.extract(text, "rust");

  EXPECT_EQ(metadata.class_name, "Config");
  EXPECT_EQ(metadata.function_name, "load");
}

TEST_F(ContextExtractorTest, CFamily_ClassAndFunction) {
  EXPECT_EQ(extractor_.extract("class Parser {\n};\n", "cpp").class_name, "Parser");
  EXPECT_EQ(extractor_.extract("struct node {\n};\n", "c").class_name, "node");

  ChunkMetadata metadata =
      extractor_.extract("static int compute(int a, int b) {\n  return a + b;\n}\n", "c");
  EXPECT_EQ(metadata.function_name, "compute");
}

TEST_F(ContextExtractorTest, CFamily_BodyMayOpenOnALaterLine) {
  std::string text =
      "int parse_args(int argc,\n"
      "               char** argv)\n"
      "{\n"
      "  return 0;\n"
      "}\n";

  EXPECT_EQ(extractor_.extract(text, "c").function_name, "parse_args");
}

TEST_F(ContextExtractorTest, CFamily_PrototypeIsNotAFunction) {
  ChunkMetadata metadata = extractor_.extract("int compute(int a);\n", "cpp");

  EXPECT_FALSE(metadata.function_name.has_value());
}

TEST_F(ContextExtractorTest, MatchesNeverSpanLines) {
  ChunkMetadata metadata = extractor_.extract("class\nOrphan:\n    pass\n", "python");

  EXPECT_FALSE(metadata.class_name.has_value());
}

TEST_F(ContextExtractorTest, HugeSingleLineIsIgnored) {
  std::string text = "    public ";
  for (int i = 0; i < 100000; ++i) {
    text += "a ";
  }
  text += "run() {\n    }\n    public void stop() {\n    }\n";

  ChunkMetadata metadata = extractor_.extract(text, "java");

  EXPECT_EQ(metadata.function_name, "stop");
}

TEST_F(ContextExtractorTest, ControlFlowKeywordIsNeverReportedAsFunction) {
  std::string text =
      "else if (x) {\n"
      "  run();\n"
      "}\n";

  ChunkMetadata metadata = extractor_.extract(text, "cpp");

  EXPECT_FALSE(metadata.function_name.has_value());
}

TEST_F(ContextExtractorTest, DenylistedMatchDoesNotHideLaterDeclaration) {
  std::string text =
      "else if (x) {\n"
      "}\n"
      "int compute(int a) {\n"
      "  if (a) {\n"
      "    return a;\n"
      "  }\n"
      "}\n";

  ChunkMetadata metadata = extractor_.extract(text, "cpp");

  ASSERT_TRUE(metadata.function_name.has_value());
  EXPECT_EQ(*metadata.function_name, "compute");
  EXPECT_NE(*metadata.function_name, "if");
}

TEST_F(ContextExtractorTest, JavaControlFlowLineIsNotAMethod) {
  std::string text =
      "        if (x) {\n"
      "            return;\n"
      "        }\n";

  ChunkMetadata metadata = extractor_.extract(text, "java");

  EXPECT_FALSE(metadata.function_name.has_value());
  EXPECT_FALSE(metadata.class_name.has_value());
}

TEST_F(ContextExtractorTest, ConfiguredDenylistIsApplied) {
  config_.keyword_denylist.push_back("helper");
  ContextExtractor extractor(config_);

  ChunkMetadata metadata = extractor.extract("def helper():\n    pass\ndef main():\n    pass\n",
                                             "python");

  EXPECT_EQ(metadata.function_name, "main");
}

TEST_F(ContextExtractorTest, LanguageTagIsCaseInsensitive) {
  EXPECT_EQ(extractor_.extract("def run():\n    pass\n", "Python").function_name, "run");
}

TEST_F(ContextExtractorTest, UnrecognizedLanguageDetectsNothing) {
  ChunkMetadata metadata = extractor_.extract("class Foo\n  def bar\n  end\nend\n", "ruby");

  EXPECT_TRUE(metadata.empty());
}

TEST_F(ContextExtractorTest, NoMatchDetectsNothing) {
  ChunkMetadata metadata = extractor_.extract("x = 1\ny = 2\n", "python");

  EXPECT_TRUE(metadata.empty());
}

}  // namespace codechunk_core
