/*
 *  TestFiles.h
 *  isodemux
 *
 *  Scratch directory for test input files, removed with the fixture.
 */

#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

class TestDir
{
public:
	TestDir()
	{
		std::string tmpl = (std::filesystem::temp_directory_path() / "isodemux_test_XXXXXX").string();
		char* dir = mkdtemp( tmpl.data() );
		if ( dir == nullptr )
			throw std::runtime_error( "mkdtemp failed" );
		m_path = dir;
	}

	~TestDir()
	{
		std::error_code ec;
		std::filesystem::remove_all( m_path, ec );
	}

	TestDir( const TestDir& ) = delete;
	TestDir& operator=( const TestDir& ) = delete;

	// Write contents to name inside the directory and return its path.
	std::string write( const std::string& name, const std::string& contents ) const
	{
		std::filesystem::path p = m_path / name;
		std::filesystem::create_directories( p.parent_path() );
		std::ofstream out( p );
		out << contents;
		return p.string();
	}

	std::string path( const std::string& name ) const
	{
		return ( m_path / name ).string();
	}

	const std::filesystem::path& root() const { return m_path; }

private:
	std::filesystem::path m_path;
};

// FASTQ record with a fixed sequence and quality.
inline std::string fastq_record( const std::string& name )
{
	return "@" + name + "\nACGTACGTAC\n+\nIIIIIIIIII\n";
}
