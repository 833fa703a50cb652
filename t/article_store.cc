/*
	article_store.cc
	----------------
*/

// POSIX
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

// Standard C
#include <errno.h>
#include <stdlib.h>
#include <string.h>

// poseven
#include "poseven/types/errno_t.hh"

// sabnews-server
#include "sabnews/article_store.hh"

// tap-out
#include "tap/check.hh"
#include "tap/test.hh"


static const unsigned n_tests = 3 + 1 + 4 + 4 + 1 + 3;


using namespace sabnews;

namespace p7 = poseven;


static char the_dir[] = "/tmp/sabnews-store-XXXXXX";


static void make_fixture()
{
	CHECK( mkdtemp( the_dir ) ? 0 : -1 );
	
	CHECK( chdir( the_dir ) );
	
	int fd = CHECK( open( "test.bin", O_WRONLY | O_CREAT | O_TRUNC, 0644 ) );
	
	CHECK( write( fd, "0123456789", 10 ) );
	
	CHECK( close( fd ) );
	
	CHECK( mkdir( "folder", 0755 ) );
	
	CHECK( symlink( "loop", "loop" ) );
}

static void whole_file()
{
	article a;
	
	EXPECT( read_article( "test.bin", 0, 10, a ) == article_ok );
	
	EXPECT( a.file_size == 10 );
	
	EXPECT( a.data.size() == 10  &&  memcmp( &a.data[ 0 ], "0123456789", 10 ) == 0 );
}

static void part_of_file()
{
	article a;
	
	const article_status status = read_article( "test.bin", 3, 4, a );
	
	EXPECT( status == article_ok  &&  a.data.size() == 4  &&  memcmp( &a.data[ 0 ], "3456", 4 ) == 0 );
}

static void ranges()
{
	article a;
	
	EXPECT( read_article( "test.bin",  5, 10, a ) == article_invalid_range );
	
	EXPECT( read_article( "test.bin", 11,  0, a ) == article_invalid_range );
	
	EXPECT( read_article( "test.bin", uint64_t( -1 ), 2, a ) == article_invalid_range );
	
	article empty;
	
	EXPECT( read_article( "test.bin", 10, 0, empty ) == article_ok  &&  empty.data.empty() );
}

static void missing()
{
	article a;
	
	EXPECT( read_article( "missing.bin", 0, 1, a ) == article_no_file );
	
	EXPECT( read_article( "test.bin/child", 0, 1, a ) == article_no_file );
	
	EXPECT( read_article( "loop", 0, 1, a ) == article_no_file );
	
	char long_name[ 1024 ];
	
	memset( long_name, 'x', sizeof long_name - 1 );
	
	long_name[ sizeof long_name - 1 ] = '\0';
	
	EXPECT( read_article( long_name, 0, 1, a ) == article_no_file );
}

static void directory()
{
	article a;
	
	int errnum = 0;
	
	try
	{
		read_article( "folder", 0, 0, a );
	}
	catch ( const p7::errno_t& err )
	{
		errnum = err;
	}
	
	EXPECT( errnum == EISDIR );
}

static void confined()
{
	set_article_root( the_dir );
	
	article a;
	
	EXPECT( read_article( "test.bin", 0, 10, a ) == article_ok );
	
	EXPECT( read_article( "../test.bin", 0, 1, a ) == article_no_file );
	
	char absolute[ sizeof the_dir + sizeof "/test.bin" ];
	
	strcpy( absolute, the_dir );
	strcat( absolute, "/test.bin" );
	
	EXPECT( read_article( absolute, 0, 1, a ) == article_no_file );
	
	set_article_root( NULL );
}

static void cleanup()
{
	CHECK( unlink( "test.bin" ) );
	CHECK( unlink( "loop" ) );
	CHECK( rmdir( "folder" ) );
	CHECK( chdir( "/" ) );
	CHECK( rmdir( the_dir ) );
}

int main( int argc, char** argv )
{
	tap::start( "article_store", n_tests );
	
	make_fixture();
	
	whole_file();
	part_of_file();
	ranges();
	missing();
	directory();
	confined();
	
	cleanup();
	
	return 0;
}
