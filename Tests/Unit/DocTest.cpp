#include "Doc.h"

#include <gtest/gtest.h>

using namespace Eragen::Doc;

// Argument entry lines
TEST(ArgumentEntryTest, NameTypeDescription)
{
	ArgumentEntry entry;
	ASSERT_TRUE(ParseArgumentEntry("     a      double[3]    first p-vector (not necessarily unit length)", entry));
	EXPECT_EQ(entry.name, "a");
	EXPECT_EQ(entry.type, "double[3]");
	EXPECT_EQ(entry.doc, "first p-vector (not necessarily unit length)");
}

TEST(ArgumentEntryTest, AliasList)
{
	ArgumentEntry entry;
	ASSERT_TRUE(ParseArgumentEntry("     iy,im,id  int     year, month, day in Gregorian calendar", entry));
	EXPECT_EQ(entry.name, "iy,im,id");
	EXPECT_EQ(entry.type, "int");
}

TEST(ArgumentEntryTest, RejectsUnindentedAndShortLines)
{
	ArgumentEntry entry;
	EXPECT_FALSE(ParseArgumentEntry("a double[3] not indented", entry));
	EXPECT_FALSE(ParseArgumentEntry("  ", entry));
	EXPECT_FALSE(ParseArgumentEntry("", entry));
	EXPECT_FALSE(ParseArgumentEntry("                          (Note 1)", entry));
	EXPECT_FALSE(ParseArgumentEntry("     theta   double", entry));
}

class DocumentationBlockTest : public ::testing::Test
{
	protected:
		static std::vector<std::string> Names(const std::vector<ArgumentEntry> &entries)
		{
			std::vector<std::string> names;
			for (auto &i : entries)
				names.push_back(i.name);
			return names;
		}
};

TEST_F(DocumentationBlockTest, GivenOnly)
{
	DocumentationBlock doc("Given:\n    a        double[3]    first vector\n    b        double[3]    second vector\n  \n");
	EXPECT_EQ(Names(doc.Inputs()), (std::vector<std::string>{ "a", "b" }));
	EXPECT_TRUE(doc.Outputs().empty());
	EXPECT_EQ(doc.Inputs()[1].doc, "second vector");
}

TEST_F(DocumentationBlockTest, StripsCommentMarkers)
{
	DocumentationBlock doc(
		"/*\n"
		"**  - - - - - - -\n"
		"**   e r a P v m\n"
		"**  - - - - - - -\n"
		"**\n"
		"**  Modulus of pv-vector.\n"
		"**\n"
		"**  Given:\n"
		"**     pv     double[2][3]   pv-vector\n"
		"**\n"
		"**  Returned:\n"
		"**     r      double         modulus of position component\n"
		"**     s      double         modulus of velocity component\n"
		"**\n"
		"*/");
	EXPECT_EQ(Names(doc.Inputs()), (std::vector<std::string>{ "pv" }));
	EXPECT_EQ(Names(doc.Outputs()), (std::vector<std::string>{ "r", "s" }));
	EXPECT_EQ(doc.Text().find("**"), std::string::npos);
}

TEST_F(DocumentationBlockTest, GivenAndReturnedGoesToBoth)
{
	DocumentationBlock doc(
		"**  Given and returned:\n"
		"**     astrom  eraASTROM*  star-independent astrometry parameters\n"
		"**\n");
	EXPECT_EQ(Names(doc.Inputs()), (std::vector<std::string>{ "astrom", "astrom" }));
	EXPECT_EQ(Names(doc.Outputs()), (std::vector<std::string>{ "astrom" }));
	EXPECT_TRUE(doc.IsInput("astrom"));
	EXPECT_TRUE(doc.IsOutput("astrom"));
}

TEST_F(DocumentationBlockTest, AllSectionsTogether)
{
	DocumentationBlock doc(
		"**  Given:\n"
		"**     date1  double     TDB as a 2-part Julian Date\n"
		"**\n"
		"**  Returned:\n"
		"**     rc,dc  double     ICRS astrometric RA,Dec (radians)\n"
		"**\n"
		"**  Given and returned:\n"
		"**     w      double[3]  work vector\n"
		"**\n");
	EXPECT_EQ(Names(doc.Inputs()), (std::vector<std::string>{ "date1", "w" }));
	EXPECT_EQ(Names(doc.Outputs()), (std::vector<std::string>{ "rc,dc", "w" }));
}

TEST_F(DocumentationBlockTest, QualifierIgnored)
{
	DocumentationBlock doc(
		"**  Returned (function value):\n"
		"**            double       angular separation (radians)\n"
		"**\n");
	ASSERT_EQ(doc.Outputs().size(), 1u);
	EXPECT_EQ(doc.Outputs()[0].name, "double");
}

TEST_F(DocumentationBlockTest, ProseMentionSkipped)
{
	DocumentationBlock doc(
		"**  Given the date, compute the angle.\n"
		"**\n"
		"**  Given:\n"
		"**     date   double     date\n"
		"**\n");
	EXPECT_EQ(Names(doc.Inputs()), (std::vector<std::string>{ "date" }));
}

TEST_F(DocumentationBlockTest, ContinuationLinesSkipped)
{
	DocumentationBlock doc(
		"**  Returned (function value):\n"
		"**               int     status:\n"
		"**                           0 = OK\n"
		"**                          -1 = bad year\n"
		"**\n");
	// "int     status:" has no description so only the status codes parse
	EXPECT_EQ(Names(doc.Outputs()), (std::vector<std::string>{ "0", "-1" }));

	DocumentationBlock notes(
		"**  Given:\n"
		"**     pv     double[2][3]   pv-vector\n"
		"**                          (Note 2)\n"
		"**\n");
	EXPECT_EQ(Names(notes.Inputs()), (std::vector<std::string>{ "pv" }));
}

TEST_F(DocumentationBlockTest, UnterminatedSectionIsAbsent)
{
	DocumentationBlock doc("Given:\n    a        double[3]    first vector\n");
	EXPECT_TRUE(doc.Inputs().empty());
	EXPECT_TRUE(doc.Outputs().empty());
}

TEST_F(DocumentationBlockTest, NoSections)
{
	DocumentationBlock doc("/* Nothing documented here. */");
	EXPECT_TRUE(doc.Inputs().empty());
	EXPECT_TRUE(doc.Outputs().empty());
	EXPECT_FALSE(doc.IsInput("a"));
}

TEST_F(DocumentationBlockTest, AliasMembershipSplitsOnCommas)
{
	DocumentationBlock doc(
		"**  Returned:\n"
		"**     ra,da   double    RA,Dec (radians)\n"
		"**\n");
	EXPECT_TRUE(doc.IsOutput("ra"));
	EXPECT_TRUE(doc.IsOutput("da"));
	EXPECT_FALSE(doc.IsOutput("ra,da"));
	EXPECT_FALSE(doc.IsOutput("r"));
	EXPECT_FALSE(doc.IsInput("ra"));
}
