#include "gtest/gtest.h"

#include <sstream>

#include <boost/make_shared.hpp>

#include "corpus/errors.h"
#include "srl/conll2009_reader.h"

namespace oxsrl {

class Conll2009ReaderTest : public ::testing::Test {
 protected:
  virtual void SetUp() {
    reader = boost::make_shared<Conll2009Reader>(
        boost::make_shared<ReaderConfig>(CorpusFormat::conll2009));
  }

  SrlSentences read(const std::string& text) {
    std::istringstream in(text);
    return reader->readStream(in, "test.txt");
  }

  boost::shared_ptr<Conll2009Reader> reader;
};

TEST_F(Conll2009ReaderTest, TestJohnLikes) {
  SrlSentences sentences = read(
      "1\tJohn\tJohn\tJohn\tNNP\tNNP\t_\t_\t2\t2\tSBJ\tSBJ\t_\t_\tA0\n"
      "2\tlikes\tlike\tlike\tVBZ\tVBZ\t_\t_\t0\t0\tROOT\tROOT\tY\tlike.01\t_\n"
      "\n");
  ASSERT_EQ(1, sentences.size());

  const SrlSentence& sentence = sentences[0];
  EXPECT_FALSE(sentence.id());
  ASSERT_EQ(2, sentence.size());
  ASSERT_EQ(1, sentence.num_predicates());

  const Predicate& likes = sentence.getPredicate(1);
  EXPECT_EQ("likes", likes.text);
  EXPECT_EQ("like.01", *likes.sense());
  ASSERT_EQ(1, likes.arguments().size());
  EXPECT_EQ("A0", likes.arguments()[0].role());
  EXPECT_EQ(0, likes.arguments()[0].start_index());
  EXPECT_EQ(1, likes.arguments()[0].end_index());
}

TEST_F(Conll2009ReaderTest, TestWordAttributes) {
  SrlSentences sentences = read(
      "1 John   John  John  NNP NNP _ _ 2 2 SBJ  SBJ  _ _       A0\n"
      "2 likes  like  like  VBZ VBZ _ _ 0 0 ROOT ROOT Y like.01 _\n"
      "3 apples apple apple NNS NNS _ _ 2 2 OBJ  OBJ  _ _       A1\n"
      "4 .      .     .     .   .   _ _ _ _ _    _    _ _       _\n");
  const SrlSentence& sentence = sentences.at(0);

  const Word& john = sentence.word_at(0);
  EXPECT_EQ(0, *john.index);
  EXPECT_EQ("John", *john.lemma);
  EXPECT_EQ("NNP", *john.pos);
  EXPECT_EQ("SBJ", *john.dep);
  EXPECT_EQ(1, *john.head);

  EXPECT_EQ(kRootHead, *sentence.word_at(1).head);
  EXPECT_FALSE(sentence.word_at(3).head);
  EXPECT_FALSE(sentence.word_at(3).dep);

  Tags expected = {"B-A0", "O", "B-A1", "O"};
  EXPECT_EQ(expected, sentence.getPredicateArgumentsBio(1));
}

TEST_F(Conll2009ReaderTest, TestTwoPredicates) {
  SrlSentences sentences = read(
      "1 Mary  Mary  Mary  NNP NNP _ _ 2 2 SBJ  SBJ  _ _       A0 A0\n"
      "2 tried try   try   VBD VBD _ _ 0 0 ROOT ROOT Y try.01  _  _\n"
      "3 to    to    to    TO  TO  _ _ 2 2 OPRD OPRD _ _       A1 _\n"
      "4 leave leave leave VB  VB  _ _ 3 3 IM   IM   Y leave.01 _ _\n");
  const SrlSentence& sentence = sentences.at(0);

  ASSERT_EQ(2, sentence.num_predicates());
  EXPECT_EQ(2, sentence.getPredicate(1).arguments().size());
  ASSERT_EQ(1, sentence.getPredicate(3).arguments().size());
  EXPECT_EQ("A0", sentence.getPredicate(3).arguments()[0].role());
  EXPECT_EQ(0, sentence.getPredicate(3).arguments()[0].start_index());
}

TEST_F(Conll2009ReaderTest, TestRoleColumnMismatch) {
  EXPECT_THROW(read("1 John John John NNP NNP _ _ 0 0 ROOT ROOT _ _ A0\n"),
               CorpusFormatError);
}

TEST_F(Conll2009ReaderTest, TestHeadOutsideSentence) {
  try {
    read("1 John  John John NNP NNP _ _ 2 2 SBJ  SBJ  _ _\n"
         "2 sleeps sleep sleep VBZ VBZ _ _ 9 9 ROOT ROOT _ _\n");
    FAIL() << "expected CorpusFormatError";
  } catch (const CorpusFormatError& e) {
    EXPECT_EQ(2, e.line_number());
  }
}

TEST_F(Conll2009ReaderTest, TestTokenIdsStartAtOne) {
  EXPECT_THROW(read("0 John John John NNP NNP _ _ 0 0 ROOT ROOT _ _\n"),
               CorpusFormatError);
}

} // namespace oxsrl
