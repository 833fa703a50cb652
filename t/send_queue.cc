/*
	send_queue.cc
	-------------
*/

// POSIX
#include <poll.h>
#include <unistd.h>

// Standard C
#include <errno.h>
#include <signal.h>
#include <string.h>

// poseven
#include "poseven/types/errno_t.hh"

// sabnews
#include "sabnews/send_queue.hh"

// tap-out
#include "tap/check.hh"
#include "tap/test.hh"


static const unsigned n_tests = 2 + 1 + 1;


using sabnews::send_queue;

namespace p7 = poseven;


static bool readable( int fd )
{
	struct pollfd pfd = { fd, POLLIN, 0 };
	
	return CHECK( poll( &pfd, 1, 0 ) ) > 0;
}

static size_t read_all( int fd, char* buffer, size_t n )
{
	size_t n_bytes = 0;
	
	while ( n_bytes < n )
	{
		ssize_t n_read = CHECK( read( fd, buffer + n_bytes, n - n_bytes ) );
		
		if ( n_read == 0 )
		{
			break;
		}
		
		n_bytes += n_read;
	}
	
	return n_bytes;
}

static void buffered()
{
	int fds[ 2 ];
	
	CHECK( pipe( fds ) );
	
	send_queue queue( fds[1] );
	
	queue.add( "abc" );
	
	EXPECT( ! readable( fds[0] ) );
	
	queue.flush();
	
	char buffer[ 4 ];
	
	EXPECT( read_all( fds[0], buffer, 3 ) == 3  &&  memcmp( buffer, "abc", 3 ) == 0 );
	
	close( fds[0] );
	close( fds[1] );
}

static void oversized()
{
	static char data[ 3 * 8192 ];
	static char buffer[ 1 + sizeof data ];
	
	memset( data, 'y', sizeof data );
	
	int fds[ 2 ];
	
	CHECK( pipe( fds ) );
	
	send_queue queue( fds[1] );
	
	queue.add( "x" );
	queue.add( data, sizeof data );  // flushes "x", then goes straight out
	
	EXPECT( read_all( fds[0], buffer, 1 + sizeof data ) == 1 + sizeof data  &&  buffer[ 0 ] == 'x' );
	
	close( fds[0] );
	close( fds[1] );
}

static void broken_pipe()
{
	int fds[ 2 ];
	
	CHECK( pipe( fds ) );
	
	close( fds[0] );
	
	send_queue queue( fds[1] );
	
	int errnum = 0;
	
	try
	{
		queue.add( "lost" );
		queue.flush();
	}
	catch ( const p7::errno_t& err )
	{
		errnum = err;
	}
	
	EXPECT( errnum == EPIPE );
	
	close( fds[1] );
}

int main( int argc, char** argv )
{
	signal( SIGPIPE, SIG_IGN );
	
	tap::start( "send_queue", n_tests );
	
	buffered();
	oversized();
	broken_pipe();
	
	return 0;
}
