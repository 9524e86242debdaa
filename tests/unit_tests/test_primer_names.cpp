/*
 *  test_primer_names.cpp
 *  isodemux
 */

#include <cppunit/extensions/HelperMacros.h>
#include <cppunit/extensions/TestFactoryRegistry.h>

#include "Errors.h"
#include "PrimerNames.h"
#include "TestFiles.h"

using namespace std;

class PrimerNamesTests : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE( PrimerNamesTests );

	CPPUNIT_TEST( testLoadKeepsFileOrder );
	CPPUNIT_TEST( testRelabelKeepsPosition );
	CPPUNIT_TEST( testDefaultsAreSorted );
	CPPUNIT_TEST( testResolveWithoutOverride );
	CPPUNIT_TEST( testResolveAppendsOmittedPrimers );
	CPPUNIT_TEST( testResolveKeepsUnobservedOverrideColumns );
	CPPUNIT_TEST_EXCEPTION( testMalformedLine, FormatError );
	CPPUNIT_TEST_EXCEPTION( testMissingFile, MissingFileError );

	CPPUNIT_TEST_SUITE_END();

public:
	void testLoadKeepsFileOrder();
	void testRelabelKeepsPosition();
	void testDefaultsAreSorted();
	void testResolveWithoutOverride();
	void testResolveAppendsOmittedPrimers();
	void testResolveKeepsUnobservedOverrideColumns();
	void testMalformedLine();
	void testMissingFile();

private:
	TestDir m_dir;
};

CPPUNIT_TEST_SUITE_REGISTRATION( PrimerNamesTests );

void PrimerNamesTests::testLoadKeepsFileOrder()
{
	PrimerNames names = PrimerNames::load( m_dir.write( "names.txt",
		"0--7 Liver\n"
		"\n"
		"0--1\tBrain\n"
		"  0--3   Heart  \n" ) );

	CPPUNIT_ASSERT_EQUAL( 3, names.size() );
	const vector<PrimerColumn>& cols = names.columns();
	CPPUNIT_ASSERT_EQUAL( string("0--7"), cols[0].primer );
	CPPUNIT_ASSERT_EQUAL( string("Liver"), cols[0].label );
	CPPUNIT_ASSERT_EQUAL( string("0--1"), cols[1].primer );
	CPPUNIT_ASSERT_EQUAL( string("Brain"), cols[1].label );
	CPPUNIT_ASSERT_EQUAL( string("Heart"), cols[2].label );
	CPPUNIT_ASSERT( names.contains( "0--3" ) );
	CPPUNIT_ASSERT( !names.contains( "0--2" ) );
}

void PrimerNamesTests::testRelabelKeepsPosition()
{
	PrimerNames names = PrimerNames::load( m_dir.write( "names.txt",
		"2 A\n3 B\n2 C\n" ) );

	CPPUNIT_ASSERT_EQUAL( 2, names.size() );
	CPPUNIT_ASSERT_EQUAL( string("2"), names.columns()[0].primer );
	CPPUNIT_ASSERT_EQUAL( string("C"), names.columns()[0].label );
}

void PrimerNamesTests::testDefaultsAreSorted()
{
	PrimerNames names = PrimerNames::defaults( { "3", "10", "2" } );
	vector<PrimerColumn> expected = { { "10", "10" }, { "2", "2" }, { "3", "3" } };
	CPPUNIT_ASSERT( expected == names.columns() );
}

void PrimerNamesTests::testResolveWithoutOverride()
{
	vector<PrimerColumn> cols = resolve_columns( { "3", "2" }, nullptr );
	vector<PrimerColumn> expected = { { "2", "2" }, { "3", "3" } };
	CPPUNIT_ASSERT( expected == cols );
}

void PrimerNamesTests::testResolveAppendsOmittedPrimers()
{
	PrimerNames names;
	names.add( "2", "SampleA" );

	vector<PrimerColumn> cols = resolve_columns( { "1", "2", "3" }, &names );
	vector<PrimerColumn> expected = { { "2", "SampleA" }, { "1", "1" }, { "3", "3" } };
	CPPUNIT_ASSERT( expected == cols );
}

void PrimerNamesTests::testResolveKeepsUnobservedOverrideColumns()
{
	PrimerNames names;
	names.add( "9", "Unused" );
	names.add( "2", "SampleA" );

	vector<PrimerColumn> cols = resolve_columns( { "2" }, &names );
	vector<PrimerColumn> expected = { { "9", "Unused" }, { "2", "SampleA" } };
	CPPUNIT_ASSERT( expected == cols );
}

void PrimerNamesTests::testMalformedLine()
{
	PrimerNames::load( m_dir.write( "names.txt", "2 SampleA\n3 Sample B\n" ) );
}

void PrimerNamesTests::testMissingFile()
{
	PrimerNames::load( m_dir.path( "no_names.txt" ) );
}
