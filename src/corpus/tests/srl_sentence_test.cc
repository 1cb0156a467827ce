#include "gtest/gtest.h"

#include <string>
#include <vector>

#include "corpus/errors.h"
#include "corpus/srl_sentence.h"

namespace oxsrl {

class SrlSentenceTest : public ::testing::Test {
 protected:
  virtual void SetUp() {
    words = {Word("John", 0), Word("likes", 1), Word("green", 2),
             Word("apples", 3), Word(".", 4)};
    sentence = SrlSentence(words, std::string("doc_0"));
    sentence.addPredicate(Predicate::fromWord(words[1], std::string("like.01")));
  }

  std::vector<Word> words;
  SrlSentence sentence;
};

TEST_F(SrlSentenceTest, TestWords) {
  EXPECT_EQ(5, sentence.size());
  EXPECT_EQ("doc_0", *sentence.id());
  EXPECT_EQ("John likes green apples . ", sentence.sentence_string());
  EXPECT_EQ(words[3], sentence.word_at(3));
  EXPECT_FALSE(sentence.is_predicate_at(0));
  EXPECT_TRUE(sentence.is_predicate_at(1));
  EXPECT_EQ("likes", sentence.word_at(1).text);
}

TEST_F(SrlSentenceTest, TestIndexOutOfRange) {
  EXPECT_THROW(sentence.at(5), OutOfRangeError);
  EXPECT_THROW(sentence.at(-1), OutOfRangeError);
  EXPECT_THROW(sentence.getPredicate(7), OutOfRangeError);
  EXPECT_THROW(sentence.slice(3, 6), OutOfRangeError);
  EXPECT_THROW(sentence.slice(2, 2), OutOfRangeError);
}

TEST_F(SrlSentenceTest, TestGetPredicateOfWord) {
  EXPECT_THROW(sentence.getPredicate(0), TypeMismatchError);
  EXPECT_THROW(sentence.getPredicateArguments(3), TypeMismatchError);
  EXPECT_THROW(sentence.makeArgument(2, "ARG0", 0, 1), TypeMismatchError);
}

TEST_F(SrlSentenceTest, TestAddPredicate) {
  Predicate predicate(Word("apples", boost::none), std::string("apple.01"));
  EXPECT_THROW(sentence.addPredicate(predicate), InvalidRequestError);
  EXPECT_THROW(sentence.addPredicate(predicate, 5), OutOfRangeError);

  Predicate& added = sentence.addPredicate(predicate, 3);
  EXPECT_EQ(3, *added.index);
  EXPECT_EQ("apple.01", *sentence.getPredicate(3).sense());
  EXPECT_EQ(5, sentence.size());

  std::vector<const Predicate*> predicates =
      static_cast<const SrlSentence&>(sentence).predicates();
  ASSERT_EQ(2, predicates.size());
  EXPECT_EQ("likes", predicates[0]->text);
  EXPECT_EQ("apples", predicates[1]->text);
  EXPECT_EQ(&sentence.getPredicate(3), &sentence.predicateAt(1));
  EXPECT_THROW(sentence.predicateAt(2), OutOfRangeError);
}

TEST_F(SrlSentenceTest, TestMakeArgument) {
  const Argument& argument = sentence.makeArgument(1, "ARG1", 2, 4);
  EXPECT_EQ("ARG1", argument.role());
  EXPECT_EQ(2, argument.start_index());
  EXPECT_EQ(4, argument.end_index());
  EXPECT_EQ(2, argument.size());
  EXPECT_EQ(&sentence.getPredicate(1), argument.predicate());

  ASSERT_EQ(2, argument.words().size());
  EXPECT_EQ("green", word_of(argument.words().front()).text);
  EXPECT_EQ("apples", word_of(argument.words().back()).text);

  EXPECT_THROW(sentence.makeArgument(1, "ARG0", 3, 3), OutOfRangeError);
  EXPECT_THROW(sentence.makeArgument(1, "ARG0", 4, 6), OutOfRangeError);
  EXPECT_EQ(1, sentence.num_arguments());
}

TEST_F(SrlSentenceTest, TestArgumentsKeepDiscoveryOrder) {
  sentence.makeArgument(1, "ARG1", 2, 4);
  sentence.makeArgument(1, "ARG0", 0, 1);

  const Arguments& arguments = sentence.getPredicateArguments(1);
  ASSERT_EQ(2, arguments.size());
  EXPECT_EQ("ARG1", arguments[0].role());
  EXPECT_EQ("ARG0", arguments[1].role());
  EXPECT_EQ(arguments, sentence.getPredicateArguments(sentence.getPredicate(1)));
}

TEST_F(SrlSentenceTest, TestBioView) {
  sentence.makeArgument(1, "ARG0", 0, 1);
  sentence.makeArgument(1, "ARG1", 2, 4);

  Tags expected = {"B-ARG0", "O", "B-ARG1", "I-ARG1", "O"};
  EXPECT_EQ(expected, sentence.getPredicateArgumentsBio(1));

  // every tagged position lies inside some argument span
  Tags tags = sentence.getPredicateArgumentsBio(1);
  for (size_t i = 0; i < tags.size(); ++i) {
    bool covered = false;
    for (const auto& argument : sentence.getPredicateArguments(1)) {
      covered |= (argument.start_index() <= static_cast<WordIndex>(i)
                  && static_cast<WordIndex>(i) < argument.end_index());
    }
    EXPECT_EQ(covered, tags[i] != "O");
  }
}

TEST_F(SrlSentenceTest, TestBioViewLaterArgumentWins) {
  sentence.makeArgument(1, "ARG0", 0, 1);
  sentence.makeArgument(1, "ARG1", 0, 3);

  Tags expected = {"B-ARG1", "I-ARG1", "I-ARG1", "O", "O"};
  EXPECT_EQ(expected, sentence.getPredicateArgumentsBio(1));
}

TEST_F(SrlSentenceTest, TestArgumentFormats) {
  sentence.makeArgument(1, "ARG0", 0, 1);

  PredicateArguments spans = sentence.getPredicateArguments(1, "span");
  ASSERT_TRUE(boost::get<Arguments>(&spans) != nullptr);
  EXPECT_EQ(1, boost::get<Arguments>(spans).size());

  PredicateArguments bio =
      sentence.getPredicateArguments(sentence.getPredicate(1), "bio");
  ASSERT_TRUE(boost::get<Tags>(&bio) != nullptr);
  EXPECT_EQ("B-ARG0", boost::get<Tags>(bio)[0]);

  EXPECT_THROW(sentence.getPredicateArguments(1, "conll"), InvalidRequestError);
  EXPECT_EQ(ArgumentFormat::bio, argumentFormatFromString("bio"));
}

TEST_F(SrlSentenceTest, TestPredicateWithoutIndex) {
  Predicate predicate(Word("likes", boost::none), std::string("like.01"));
  EXPECT_THROW(sentence.getPredicateArguments(predicate), InvalidRequestError);
}

TEST_F(SrlSentenceTest, TestCopyKeepsArgumentViews) {
  sentence.makeArgument(1, "ARG0", 0, 1);
  SrlSentence copy(sentence);
  sentence = SrlSentence();

  const Predicate& predicate = copy.getPredicate(1);
  const Argument& argument = predicate.arguments().front();
  EXPECT_EQ(&predicate, argument.predicate());
  EXPECT_EQ(&copy.at(0), &argument.words().front());
  EXPECT_EQ("John", word_of(argument.words().front()).text);
}

TEST_F(SrlSentenceTest, TestGrowingKeepsArgumentViews) {
  sentence.makeArgument(1, "ARG1", 2, 4);
  for (int i = 5; i < 100; ++i) {
    sentence.push_back(Word("very", i));
  }

  const Argument& argument = sentence.getPredicate(1).arguments().front();
  EXPECT_EQ(&sentence.getPredicate(1), argument.predicate());
  EXPECT_EQ(&sentence.at(2), &argument.words().front());
  EXPECT_EQ(100, sentence.size());
}

TEST_F(SrlSentenceTest, TestSetReplacesSlot) {
  Word word("pears", 3);
  sentence.set(3, Slot(word));
  EXPECT_EQ("pears", sentence.word_at(3).text);
  EXPECT_EQ(5, sentence.size());
  EXPECT_THROW(sentence.set(5, Slot(word)), OutOfRangeError);
}

TEST_F(SrlSentenceTest, TestAddPredicateWithArgumentsPastEnd) {
  sentence.makeArgument(1, "ARG1", 2, 5);
  Predicate predicate(sentence.getPredicate(1));

  SrlSentence small({Word("John", 0), Word("likes", 1)});
  EXPECT_THROW(small.addPredicate(predicate, 1), OutOfRangeError);
  EXPECT_THROW(small.set(1, Slot(predicate)), OutOfRangeError);
  EXPECT_THROW(small.push_back(predicate), OutOfRangeError);
  EXPECT_FALSE(small.is_predicate_at(1));
  EXPECT_EQ(2, small.size());
  EXPECT_EQ(0, small.num_predicates());

  SrlSentence fits({Word("a", 0), Word("b", 1), Word("c", 2), Word("d", 3),
                    Word("e", 4)});
  fits.addPredicate(predicate, 1);
  Tags expected = {"O", "O", "B-ARG1", "I-ARG1", "I-ARG1"};
  EXPECT_EQ(expected, fits.getPredicateArgumentsBio(1));
  EXPECT_EQ(&fits.at(2), &fits.getPredicate(1).arguments()[0].words().front());
}

TEST(ArgumentTest, TestConstruction) {
  SrlSentence sentence({Word("a", 0), Word("b", 1), Word("c", 2)});

  Argument argument("ARG2", nullptr, sentence.slice(0, 2), 0, 2);
  Tags expected = {"B-ARG2", "I-ARG2"};
  EXPECT_EQ(expected, argument.bio_tag());
  EXPECT_EQ(std::make_pair(0, 2), argument.span());

  EXPECT_THROW(Argument("ARG2", nullptr, SlotRange(), 2, 2), OutOfRangeError);
  EXPECT_THROW(Argument("ARG2", nullptr, sentence.slice(0, 1), 0, 2),
               InvalidRequestError);
}

TEST(PredicateTest, TestCopyRebindsArguments) {
  SrlSentence sentence({Word("a", 0), Word("b", 1)});
  Predicate predicate =
      Predicate::fromWord(sentence.word_at(1), std::string("b.01"));
  predicate.addArgument(Argument("ARG0", nullptr, sentence.slice(0, 1), 0, 1));
  EXPECT_EQ(&predicate, predicate.arguments()[0].predicate());

  Predicate copy(predicate);
  EXPECT_EQ(&copy, copy.arguments()[0].predicate());
  EXPECT_EQ(predicate, copy);
}

} // namespace oxsrl
