#include "Types.h"

#include <gtest/gtest.h>

using namespace Eragen::Types;

TEST(TypeTableTest, ErfaVocabulary)
{
	const TypeTable &types = ErfaTypeTable();
	EXPECT_EQ(types.Size(), 11u);
	EXPECT_EQ(types.Resolve("double"), "numpy.double");
	EXPECT_EQ(types.Resolve("int *"), "numpy.int");
	EXPECT_EQ(types.Resolve("double[2][3]"), "numpy.dtype([('pv', 'd', (2,3))])");
	EXPECT_EQ(types.Resolve("eraASTROM *"), "dt_eraASTROM");
	EXPECT_EQ(types.Resolve("char *"), "numpy.dtype('S1')");
}

// Array shape matters for storage even though both are pointers at the call
TEST(TypeTableTest, PointerAndArrayAreDistinct)
{
	const TypeTable &types = ErfaTypeTable();
	ASSERT_TRUE(types.Contains("double *"));
	ASSERT_TRUE(types.Contains("double[3]"));
	EXPECT_NE(types.Resolve("double *"), types.Resolve("double[3]"));
	EXPECT_NE(types.Resolve("int *"), types.Resolve("int[4]"));
}

TEST(TypeTableTest, ConstQualifierIgnored)
{
	const TypeTable &types = ErfaTypeTable();
	EXPECT_EQ(types.Resolve("const char *"), types.Resolve("char *"));
}

TEST(TypeTableTest, UnknownTypeThrows)
{
	const TypeTable &types = ErfaTypeTable();
	EXPECT_THROW(types.Resolve("float"), UnknownTypeError);
	EXPECT_THROW(types.Resolve("double[4]"), UnknownTypeError);
	EXPECT_THROW(types.Resolve("const float *"), UnknownTypeError);

	try
	{
		types.Resolve("eraLDBODY *");
		FAIL() << "expected UnknownTypeError";
	}
	catch (const UnknownTypeError &e)
	{
		EXPECT_EQ(e.type, "eraLDBODY *");
		EXPECT_TRUE(e.function.empty());
		EXPECT_NE(std::string(e.what()).find("eraLDBODY *"), std::string::npos);
	}
}

// Separate tables don't share vocabulary
TEST(TypeTableTest, CustomTable)
{
	TypeTable types = { { "float", "numpy.float32" } };
	EXPECT_EQ(types.Resolve("float"), "numpy.float32");
	EXPECT_THROW(types.Resolve("double"), UnknownTypeError);
	EXPECT_FALSE(ErfaTypeTable().Contains("float"));
}

TEST(CallTypeTest, PointerStripped)
{
	EXPECT_EQ(CallType("double[3]"), "double *");
	EXPECT_EQ(CallType("double[2][3]"), "double *");
	EXPECT_EQ(CallType("int[4]"), "int *");
	EXPECT_EQ(CallType("const char *"), "char *");
	EXPECT_EQ(CallType("double *"), "double *");
	EXPECT_EQ(CallType("double"), "double");
	EXPECT_EQ(CallType("eraASTROM *"), "eraASTROM *");
}
