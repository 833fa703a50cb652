/*
	session.cc
	----------
*/

// POSIX
#include <fcntl.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/wait.h>

// Standard C
#include <stdlib.h>
#include <string.h>

// sabnews
#include "sabnews/message_id.hh"
#include "sabnews/write_in_full.hh"

// sabnews-server
#include "sabnews/server.hh"
#include "sabnews/session.hh"

// tap-out
#include "tap/check.hh"
#include "tap/test.hh"


static const unsigned n_tests = 4 + 1 + 3 + 7 + 1 + 1 + 3 + 2;


using namespace sabnews;

using tap::ok_if;


#define STR_LEN( s )  "" s, (sizeof s - 1)


static char the_dir[] = "/tmp/sabnews-session-XXXXXX";

static const char greeting[] = "200 Welcome (SABNews)\r\n";

static const char article_command[] =
	"ARTICLE <file=test.bin|part=1|start=0|size=10>\r\n";

static const char article_response[] =
	"222 0 <file=test.bin|part=1|start=0|size=10>\r\n"
	"Message-ID: <file=test.bin|part=1|start=0|size=10>\r\n"
	"Subject: \"test.bin\"\r\n"
	"\r\n"
	"=ybegin part=1 line=128 size=10 name=test.bin\r\n"
	"=ypart begin=1 end=10\r\n"
	"Z\r\n" "[\r\n" "\\\r\n" "]\r\n" "^\r\n"
	"_\r\n" "`\r\n" "a\r\n" "b\r\n" "c\r\n"
	"=yend size=10 part=1 pcrc32=00000000\r\n";

static const char bad_message_id[] = "430 No Such Article Found (bad message-id)\r\n";
static const char no_file[]        = "430 No Such Article Found (no file on disk)\r\n";
static const char invalid_range[]  = "430 No Such Article Found (invalid start/size attributes)\r\n";
static const char unreadable[]     = "430 No Such Article Found (unreadable file)\r\n";
static const char closing[]        = "205 Connection closing\r\n";


static int   the_socket = -1;
static pid_t the_server;


static void make_fixture()
{
	CHECK( mkdtemp( the_dir ) ? 0 : -1 );
	
	CHECK( chdir( the_dir ) );
	
	int fd = CHECK( open( "test.bin", O_WRONLY | O_CREAT | O_TRUNC, 0644 ) );
	
	CHECK( write( fd, "0123456789", 10 ) );
	
	CHECK( close( fd ) );
}

static void start_server()
{
	int fds[ 2 ];
	
	CHECK( socketpair( PF_LOCAL, SOCK_STREAM, 0, fds ) );
	
	the_server = CHECK( fork() );
	
	if ( the_server == 0 )
	{
		close( fds[0] );
		
		const int status = run_session( fds[1], fds[1] );
		
		_exit( status != 0 );
	}
	
	CHECK( close( fds[1] ) );
	
	the_socket = fds[0];
}

static void send_command( const char* command )
{
	write_in_full( the_socket, command, strlen( command ) );
}

static void send_article_command( const char*  file,
                                  uint64_t     start,
                                  uint64_t     size )
{
	const plus::var_string id = format_message_id( file, 1, start, size );
	
	plus::var_string command;
	
	command.append( STR_LEN( "ARTICLE " ) );
	command.append( id.data(), id.size() );
	command.append( STR_LEN( "\r\n" ) );
	
	send_command( command.c_str() );
}

static bool receives( const char* expected, size_t n )
{
	char* buffer = (char*) malloc( n );
	
	size_t n_bytes = 0;
	
	while ( n_bytes < n )
	{
		ssize_t n_read = CHECK( read( the_socket, buffer + n_bytes, n - n_bytes ) );
		
		if ( n_read == 0 )
		{
			break;
		}
		
		n_bytes += n_read;
	}
	
	const bool matched = n_bytes == n  &&  memcmp( buffer, expected, n ) == 0;
	
	free( buffer );
	
	return matched;
}

#define RECEIVES( s )  receives( s, sizeof s - 1 )

static bool at_eof()
{
	char c;
	
	return CHECK( read( the_socket, &c, 1 ) ) == 0;
}

static void connection_state()
{
	int fds[ 2 ];
	
	CHECK( socketpair( PF_LOCAL, SOCK_STREAM, 0, fds ) );
	
	session s( fds[0] );
	
	EXPECT( ! s.connected() );
	
	s.connect();
	
	EXPECT( s.connected() );
	
	s.disconnect();
	
	EXPECT( ! s.connected() );
	
	the_socket = fds[1];
	
	EXPECT( RECEIVES( greeting )  &&  RECEIVES( closing ) );
	
	CHECK( close( fds[0] ) );
	CHECK( close( fds[1] ) );
	
	the_socket = -1;
}

static void greet()
{
	EXPECT( RECEIVES( greeting ) );
}

static void articles()
{
	send_command( article_command );
	
	EXPECT( RECEIVES( article_response ) );
	
	// the same request again gets the same bytes
	
	send_command( article_command );
	
	EXPECT( RECEIVES( article_response ) );
	
	send_command( "BODY <file=test.bin|part=1|start=0|size=10>\r\n" );
	
	EXPECT( RECEIVES( article_response ) );
}

static void not_found()
{
	send_command( "ARTICLE <12345@example.com>\r\n" );
	
	EXPECT( RECEIVES( bad_message_id ) );
	
	send_article_command( "missing.bin", 0, 10 );
	
	EXPECT( RECEIVES( no_file ) );
	
	send_article_command( "test.bin", 5, 10 );
	
	EXPECT( RECEIVES( invalid_range ) );
	
	// a start beyond 64 bits is a range error, not a bad message-id
	
	send_command( "ARTICLE <file=test.bin|part=1|start=18446744073709551616|size=1>\r\n" );
	
	EXPECT( RECEIVES( invalid_range ) );
	
	// the fixture directory exists but can't be served
	
	send_article_command( ".", 0, 0 );
	
	EXPECT( RECEIVES( unreadable ) );
	
	send_command( article_command );
	
	EXPECT( RECEIVES( article_response ) );
	
	// connection still usable
	
	send_command( "BODY <file=test.bin|part=1|start=0|size=11>\r\n" );
	
	EXPECT( RECEIVES( invalid_range ) );
}

static void split_command()
{
	send_command( "ARTICLE <file=test.bin|part=1|sta" );
	send_command( "rt=5|size=10>\r\n" );
	
	EXPECT( RECEIVES( invalid_range ) );
}

static void pipelined()
{
	// unknown commands get no response at all
	
	send_command( "HELP\r\nARTICLE <file=missing.bin|part=1|start=0|size=1>\r\n" );
	
	EXPECT( RECEIVES( no_file ) );
}

static void quit()
{
	send_command( "QUIT\r\n" );
	
	EXPECT( RECEIVES( closing ) );
	
	EXPECT( at_eof() );
	
	int status;
	
	ok_if( wait( &status ) == the_server );
	
	CHECK( close( the_socket ) );
}

static void quit_first()
{
	start_server();
	
	send_command( "QUIT\r\n" );
	
	EXPECT( RECEIVES( greeting )  &&  RECEIVES( closing ) );
	
	int status;
	
	ok_if( wait( &status ) == the_server  &&  status == 0 );
	
	CHECK( close( the_socket ) );
}

static void cleanup()
{
	CHECK( unlink( "test.bin" ) );
	CHECK( chdir( "/" ) );
	CHECK( rmdir( the_dir ) );
}

int main( int argc, char** argv )
{
	alarm( 60 );
	
	tap::start( "session", n_tests );
	
	make_fixture();
	
	connection_state();
	
	start_server();
	
	greet();
	articles();
	not_found();
	split_command();
	pipelined();
	quit();
	
	quit_first();
	
	cleanup();
	
	return 0;
}
