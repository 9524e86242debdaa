/*
 *  test_mapped_reads.cpp
 *  isodemux
 */

#include <cppunit/extensions/HelperMacros.h>
#include <cppunit/extensions/TestFactoryRegistry.h>

#include <htslib/bgzf.h>

#include "Errors.h"
#include "MappedReads.h"
#include "TestFiles.h"

using namespace std;

class MappedReadsTests : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE( MappedReadsTests );

	CPPUNIT_TEST( testIsoformFromRecordName );
	CPPUNIT_TEST( testFirstAppearanceOrder );
	CPPUNIT_TEST( testCompressedInput );
	CPPUNIT_TEST_EXCEPTION( testMissingFile, MissingFileError );
	CPPUNIT_TEST_EXCEPTION( testTruncatedRecord, FormatError );

	CPPUNIT_TEST_SUITE_END();

public:
	void testIsoformFromRecordName();
	void testFirstAppearanceOrder();
	void testCompressedInput();
	void testMissingFile();
	void testTruncatedRecord();

private:
	TestDir m_dir;
};

CPPUNIT_TEST_SUITE_REGISTRATION( MappedReadsTests );

void MappedReadsTests::testIsoformFromRecordName()
{
	CPPUNIT_ASSERT_EQUAL( string("PB.3811.1"),
		isoform_from_record_name( "PB.3811.1|chr1:14500-15200(+)|c4567/f12p0/1650" ) );
	CPPUNIT_ASSERT_EQUAL( string("PB.1.1"), isoform_from_record_name( "PB.1.1" ) );
	CPPUNIT_ASSERT_EQUAL( string(""), isoform_from_record_name( "|c1/f1p0/100" ) );
}

void MappedReadsTests::testFirstAppearanceOrder()
{
	string path = m_dir.write( "mapped.fastq",
		fastq_record( "PB.2.1|chr2:100-900(-)|c10/f3p0/800" ) +
		fastq_record( "PB.1.1|chr1:100-900(+)|c11/f5p0/800" ) +
		fastq_record( "PB.2.1|chr2:100-950(-)|c12/f2p0/850" ) +
		fastq_record( "PB.1.2|chr1:200-900(+)|c13/f1p0/700" ) );

	vector<string> isoforms = read_mapped_isoforms( path );
	vector<string> expected = { "PB.2.1", "PB.1.1", "PB.1.2" };
	CPPUNIT_ASSERT( expected == isoforms );
}

void MappedReadsTests::testMissingFile()
{
	read_mapped_isoforms( m_dir.path( "missing.fastq" ) );
}

void MappedReadsTests::testCompressedInput()
{
	string records =
		fastq_record( "PB.5.1|chr5:10-800(+)|c1/f4p0/790" ) +
		fastq_record( "PB.4.1|chr4:10-600(-)|c2/f2p0/590" ) +
		fastq_record( "PB.5.1|chr5:12-800(+)|c3/f1p0/788" );
	string path = m_dir.path( "mapped.fastq.gz" );
	BGZF* fp = bgzf_open( path.c_str(), "w" );
	CPPUNIT_ASSERT( fp != nullptr );
	CPPUNIT_ASSERT_EQUAL( ssize_t( records.size() ), bgzf_write( fp, records.data(), records.size() ) );
	CPPUNIT_ASSERT_EQUAL( 0, bgzf_close( fp ) );

	vector<string> isoforms = read_mapped_isoforms( path );
	vector<string> expected = { "PB.5.1", "PB.4.1" };
	CPPUNIT_ASSERT( expected == isoforms );
}

void MappedReadsTests::testTruncatedRecord()
{
	// quality line shorter than the sequence
	string path = m_dir.write( "truncated.fastq",
		fastq_record( "PB.1.1|chr1:100-900(+)|c11/f5p0/800" ) +
		"@PB.1.2|chr1:200-900(+)|c13/f1p0/700\nACGTACGTAC\n+\nIII\n" );
	read_mapped_isoforms( path );
}
