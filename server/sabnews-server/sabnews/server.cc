/*
	sabnews/server.cc
	-----------------
*/

#include "sabnews/server.hh"

// Standard C
#include <stdio.h>
#include <string.h>

// poseven
#include "poseven/types/errno_t.hh"

// sabnews
#include "sabnews/event_loop.hh"
#include "sabnews/message_id.hh"
#include "sabnews/receiver.hh"
#include "sabnews/send_queue.hh"
#include "sabnews/yenc.hh"

// sabnews-server
#include "sabnews/article_store.hh"
#include "sabnews/response.hh"
#include "sabnews/session.hh"


#define STR_LEN( s )  "" s, (sizeof s - 1)


namespace sabnews {

namespace p7 = poseven;


static crc_policy the_crc_policy = crc_empty;

static bool verbose;


void set_true_crc( bool true_crc )
{
	the_crc_policy = true_crc ? crc_payload : crc_empty;
}

void set_verbose( bool v )
{
	verbose = v;
}

static inline
bool begins_with( const char* line, std::size_t n, const char* s, std::size_t len )
{
	return n >= len  &&  memcmp( line, s, len ) == 0;
}

static inline
int printable_length( const char* line, std::size_t n )
{
	while ( n > 0  &&  (line[ n - 1 ] == '\n'  ||  line[ n - 1 ] == '\r') )
	{
		--n;
	}
	
	return int( n );
}

static
not_found_reason reason_for( article_status status )
{
	switch ( status )
	{
		case article_no_file:        return reason_no_file;
		case article_invalid_range:  return reason_invalid_range;
		
		default:
			break;
	}
	
	return reason_unreadable;
}

static
void serve_article( session& s, const char* line, std::size_t n )
{
	article_request r;
	
	if ( ! parse_article_command( line, n, r ) )
	{
		fprintf( stderr, "Can't parse article information\n" );
		
		send_not_found( s.queue(), reason_bad_message_id );
		return;
	}
	
	const char* path = r.file.c_str();
	
	article a;
	
	article_status status;
	
	try
	{
		status = read_article( path, r.start, r.size, a );
	}
	catch ( const p7::errno_t& err )
	{
		fprintf( stderr, "%s: %s\n", path, strerror( err ) );
		
		send_not_found( s.queue(), reason_unreadable );
		return;
	}
	
	if ( status != article_ok )
	{
		fprintf( stderr, status == article_no_file ? "File not found: %s\n"
		                                           : "Invalid start/size attributes: %s\n",
		                 path );
		
		send_not_found( s.queue(), reason_for( status ) );
		return;
	}
	
	const char* file_base = file_base_name( path );
	
	queue_article_headers( s.queue(), r.message_id, file_base );
	
	const yenc_part part =
	{
		file_base,
		r.part,
		r.start,
		a.file_size,
		the_crc_policy,
	};
	
	const char* data = a.data.empty() ? NULL : &a.data[ 0 ];
	
	queue_yenc( s.queue(), part, data, a.data.size() );
	
	s.queue().flush();
	
	if ( verbose )
	{
		fprintf( stderr, "Served %s part %llu (%llu bytes)\n",
		                 path,
		                 (unsigned long long) r.part,
		                 (unsigned long long) r.size );
	}
}

int command_handler( void* that, const char* line, std::size_t n )
{
	session& s = *(session*) that;
	
	if ( verbose )
	{
		fprintf( stderr, "Data received: %.*s\n", printable_length( line, n ), line );
	}
	
	try
	{
		if ( begins_with( line, n, STR_LEN( "QUIT" ) ) )
		{
			s.disconnect();
			
			return 1;
		}
		
		if ( begins_with( line, n, STR_LEN( "ARTICLE" ) )  ||
		     begins_with( line, n, STR_LEN( "BODY"    ) ) )
		{
			serve_article( s, line, n );
		}
	}
	catch ( const p7::errno_t& err )
	{
		fprintf( stderr, "Write failed: %s\n", strerror( err ) );
		
		return -err;
	}
	
	return 0;
}

int run_session( int input_fd, int output_fd )
{
	session s( output_fd );
	
	try
	{
		s.connect();
	}
	catch ( const p7::errno_t& err )
	{
		fprintf( stderr, "Write failed: %s\n", strerror( err ) );
		
		return -err;
	}
	
	line_receiver r( &command_handler, &s );
	
	return run_event_loop( r, input_fd );
}

}  // namespace sabnews
