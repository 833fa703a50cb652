/*
	sabnewsd.cc
	-----------
*/

// POSIX
#include <fcntl.h>
#include <unistd.h>

// Standard C
#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

// more-posix
#include "more/perror.hh"

// command
#include "command/get_option.hh"

// gear
#include "gear/parse_decimal.hh"

// poseven
#include "poseven/types/errno_t.hh"

// sabnews-server
#include "sabnews/article_store.hh"
#include "sabnews/listener.hh"
#include "sabnews/server.hh"


using namespace command::constants;
using namespace sabnews;

namespace p7 = poseven;


enum
{
	Option_quiet   = 'q',
	Option_verbose = 'v',
	
	Option_last_byte = 255,
	
	Option_host,
	Option_port,
	Option_root,
	Option_stdio,
	Option_true_crc,
};

static command::option options[] =
{
	{ "quiet",    Option_quiet },
	{ "verbose",  Option_verbose },
	{ "host",     Option_host,     Param_required },
	{ "port",     Option_port,     Param_required },
	{ "root",     Option_root,     Param_required },
	{ "stdio",    Option_stdio },
	{ "true-crc", Option_true_crc },
	{ NULL }
};

static const char* the_host = "127.0.0.1";

static unsigned the_port = 8888;

static bool serving_stdio;


static
char* const* get_options( char* const* argv )
{
	++argv;  // skip arg 0
	
	short opt;
	
	while ( (opt = command::get_option( &argv, options )) )
	{
		switch ( opt )
		{
			case Option_quiet:
				int dev_null;
				dev_null = open( "/dev/null", O_WRONLY );
				
				if ( dev_null >= 0 )
				{
					dup2( dev_null, STDERR_FILENO );
					
					close( dev_null );
				}
				break;
			
			case Option_verbose:
				set_verbose( true );
				break;
			
			case Option_host:
				the_host = command::global_result.param;
				break;
			
			case Option_port:
				the_port = gear::parse_unsigned_decimal( command::global_result.param );
				break;
			
			case Option_root:
				set_article_root( command::global_result.param );
				break;
			
			case Option_stdio:
				serving_stdio = true;
				break;
			
			case Option_true_crc:
				set_true_crc( true );
				break;
			
			default:
				abort();
		}
	}
	
	return argv;
}

static
int ignore_sigpipe()
{
	struct sigaction action = {{ 0 }};
	action.sa_handler = SIG_IGN;
	
	return sigaction( SIGPIPE, &action, NULL );
}

static
int serve_socket( int fd )
{
	return run_session( fd, fd );
}

int main( int argc, char* const* argv )
{
	char *const *args = get_options( argv );
	
	if ( *args != NULL )
	{
		fprintf( stderr, "sabnewsd: unexpected argument '%s'\n", *args );
		
		return 2;
	}
	
	if ( ignore_sigpipe() != 0 )
	{
		more::perror( "sabnewsd", errno );
		
		return 1;
	}
	
	if ( serving_stdio )
	{
		int looped = run_session( STDIN_FILENO, STDOUT_FILENO );
		
		return looped != 0;
	}
	
	int listener_fd;
	
	try
	{
		listener_fd = listen_tcp( the_host, the_port );
	}
	catch ( const p7::errno_t& err )
	{
		more::perror( "sabnewsd", the_host, err );
		
		return 1;
	}
	
	fprintf( stderr, "Starting SABNews on %s:%u\n", the_host, the_port );
	
	int served = serve_connections( listener_fd, &serve_socket );
	
	more::perror( "sabnewsd", -served );
	
	close( listener_fd );
	
	return 1;
}
