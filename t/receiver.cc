/*
	receiver.cc
	-----------
*/

// POSIX
#include <unistd.h>

// Standard C
#include <string.h>

// plus
#include "plus/var_string.hh"

// sabnews
#include "sabnews/event_loop.hh"
#include "sabnews/receiver.hh"

// tap-out
#include "tap/check.hh"
#include "tap/test.hh"


static const unsigned n_tests = 4 + 3 + 2;


using namespace sabnews;


#define STR_LEN( s )  "" s, (sizeof s - 1)


static plus::var_string lines[ 4 ];

static unsigned n_lines;


static int collect( void* that, const char* line, std::size_t n )
{
	if ( n_lines < 4 )
	{
		lines[ n_lines ].assign( line, n );
	}
	
	++n_lines;
	
	return 0;
}

static int stop_at_B( void* that, const char* line, std::size_t n )
{
	++n_lines;
	
	return line[ 0 ] == 'B';
}

static bool equals( const plus::string& s, const char* expected )
{
	const size_t n = strlen( expected );
	
	return s.size() == n  &&  memcmp( s.data(), expected, n ) == 0;
}

static void split_lines()
{
	n_lines = 0;
	
	line_receiver r( &collect, NULL );
	
	r.recv_bytes( STR_LEN( "QU" ) );
	r.recv_bytes( STR_LEN( "IT\r\nARTI" ) );
	r.recv_bytes( STR_LEN( "CLE\r\n" ) );
	
	EXPECT( n_lines == 2 );
	
	EXPECT( equals( lines[ 0 ], "QUIT\r\n" ) );
	
	EXPECT( equals( lines[ 1 ], "ARTICLE\r\n" ) );
	
	EXPECT( r.pending() == 0 );
}

static void stop()
{
	n_lines = 0;
	
	line_receiver r( &stop_at_B, NULL );
	
	EXPECT( r.recv_bytes( STR_LEN( "A\nB\nC\n" ) ) == 1 );
	
	EXPECT( n_lines == 2 );
	
	EXPECT( r.pending() == 2 );
}

static void loop()
{
	n_lines = 0;
	
	int fds[ 2 ];
	
	CHECK( pipe( fds ) );
	
	CHECK( write( fds[1], STR_LEN( "X\r\nY\r\npartial" ) ) );
	
	CHECK( close( fds[1] ) );
	
	line_receiver r( &collect, NULL );
	
	EXPECT( run_event_loop( r, fds[0] ) == 0 );
	
	EXPECT( n_lines == 2  &&  equals( lines[ 1 ], "Y\r\n" ) );
	
	close( fds[0] );
}

int main( int argc, char** argv )
{
	tap::start( "receiver", n_tests );
	
	split_lines();
	stop();
	loop();
	
	return 0;
}
