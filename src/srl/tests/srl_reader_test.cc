#include "gtest/gtest.h"

#include <sstream>

#include "corpus/errors.h"
#include "srl/reader_factory.h"
#include "srl/sentence_block.h"
#include "srl/tests/corpus_file_test.h"
#include "srl/token_normalizer.h"

namespace oxsrl {

namespace {

std::string conll2012Sentence(const std::string& document,
                              const std::string& word) {
  return document + " 0 0 " + word + " NN (TOP*) - - - - * -\n"
       + document + " 0 1 . . *) - - - - * -\n\n";
}

}  // namespace

class SrlReaderTest : public CorpusFileTest {
 protected:
  virtual void SetUp() {
    CorpusFileTest::SetUp();
    config = makeConfig(CorpusFormat::conll2012);
  }

  boost::shared_ptr<ReaderConfig> config;
};

TEST_F(SrlReaderTest, TestReadDirectory) {
  writeFile("b.gold_conll", conll2012Sentence("b", "beta"));
  writeFile("a.gold_conll", conll2012Sentence("a", "alpha")
                            + conll2012Sentence("a", "alpha2"));
  writeFile("sub/c.gold_conll", conll2012Sentence("c", "gamma"));
  writeFile("notes.txt", "not a corpus file\n");

  boost::shared_ptr<SrlReader> reader = createReader(config);
  std::vector<std::string> files = reader->listFiles(dir.string());
  ASSERT_EQ(3, files.size());

  SrlSentences sentences = reader->read(dir.string());
  ASSERT_EQ(4, sentences.size());
  EXPECT_EQ("alpha", sentences[0].word_at(0).text);
  EXPECT_EQ("alpha2", sentences[1].word_at(0).text);
  EXPECT_EQ("beta", sentences[2].word_at(0).text);
  EXPECT_EQ("gamma", sentences[3].word_at(0).text);
}

TEST_F(SrlReaderTest, TestReadDirectoryInParallel) {
  for (int i = 0; i < 8; ++i) {
    std::string name = "part_" + std::to_string(i) + ".gold_conll";
    writeFile(name, conll2012Sentence("d", "w" + std::to_string(i)));
  }

  config->threads = 4;
  SrlSentences sentences = createReader(config)->read(dir.string());
  ASSERT_EQ(8, sentences.size());
  for (int i = 0; i < 8; ++i) {
    EXPECT_EQ("w" + std::to_string(i), sentences[i].word_at(0).text);
  }
}

TEST_F(SrlReaderTest, TestDirectoryErrorNamesFile) {
  writeFile("a.gold_conll", conll2012Sentence("a", "alpha"));
  std::string bad = writeFile("b.gold_conll", "b 0 0 beta NN\n");

  config->threads = 2;
  try {
    createReader(config)->read(dir.string());
    FAIL() << "expected CorpusFormatError";
  } catch (const CorpusFormatError& e) {
    EXPECT_EQ(bad, e.filename());
    EXPECT_EQ(1, e.line_number());
  }
}

TEST_F(SrlReaderTest, TestCustomSuffix) {
  writeFile("a.gold_conll", conll2012Sentence("a", "alpha"));
  writeFile("b.conll", conll2012Sentence("b", "beta"));

  config->file_suffix = ".conll";
  SrlSentences sentences = createReader(config)->read(dir.string());
  ASSERT_EQ(1, sentences.size());
  EXPECT_EQ("beta", sentences[0].word_at(0).text);
}

TEST_F(SrlReaderTest, TestListMissingDirectory) {
  std::string missing = (dir / "missing").string();
  try {
    createReader(config)->listFiles(missing);
    FAIL() << "expected CorpusFormatError";
  } catch (const CorpusFormatError& e) {
    EXPECT_EQ(missing, e.filename());
    EXPECT_EQ(0, e.line_number());
  }
}

TEST(SentenceBlockTest, TestBlocks) {
  std::istringstream in(
      "# first\n"
      "a 1\r\n"
      "b 2\n"
      "\n"
      "\n"
      "  \n"
      "# second\n"
      "\n"
      "c 3");
  SentenceBlockReader reader(in, "blocks.txt", "#");
  SentenceBlock block;

  ASSERT_TRUE(reader.next(&block));
  EXPECT_EQ("blocks.txt", block.filename);
  std::vector<std::string> lines = {"a 1", "b 2"};
  EXPECT_EQ(lines, block.lines);
  std::vector<int> line_numbers = {2, 3};
  EXPECT_EQ(line_numbers, block.line_numbers);
  ASSERT_EQ(1, block.comments.size());
  EXPECT_EQ("# first", block.comments[0]);

  ASSERT_TRUE(reader.next(&block));
  EXPECT_EQ(1, block.size());
  EXPECT_EQ(9, block.first_line());
  ASSERT_EQ(1, block.comments.size());
  EXPECT_EQ("# second", block.comments[0]);

  EXPECT_FALSE(reader.next(&block));
  EXPECT_TRUE(block.empty());
}

TEST(SentenceBlockTest, TestEmptyStream) {
  std::istringstream in("\n\n");
  SentenceBlockReader reader(in, "empty.txt", "#");
  SentenceBlock block;
  EXPECT_FALSE(reader.next(&block));
}

TEST(TokenNormalizerTest, TestEscapes) {
  TokenNormalizer normalizer;
  EXPECT_EQ("(", normalizer.normalize("-LRB-"));
  EXPECT_EQ("}", normalizer.normalize("-RCB-"));
  EXPECT_EQ("\"", normalizer.normalize("``"));
  EXPECT_EQ("\"", normalizer.normalize("''"));
  EXPECT_EQ("word", normalizer.normalize("word"));
  EXPECT_EQ("\"", normalizer.normalizeUnited(""));
  EXPECT_EQ("-", normalizer.normalizeUnited("-"));
}

TEST(ReaderConfigTest, TestFormats) {
  EXPECT_EQ(CorpusFormat::conll2009, corpusFormatFromString("conll2009"));
  EXPECT_EQ(CorpusFormat::conll2012, corpusFormatFromString("conll-2012"));
  EXPECT_EQ(CorpusFormat::united, corpusFormatFromString("united"));
  EXPECT_THROW(corpusFormatFromString("conllu"), InvalidRequestError);

  ReaderConfig config(CorpusFormat::united);
  EXPECT_EQ(".conllu", config.file_suffix);
  EXPECT_EQ("united", corpusFormatName(config.format));
  EXPECT_TRUE(config == ReaderConfig(CorpusFormat::united));
  EXPECT_FALSE(config == ReaderConfig());
}

} // namespace oxsrl
