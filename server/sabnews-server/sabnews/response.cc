/*
	sabnews/response.cc
	-------------------
*/

#include "sabnews/response.hh"

// Standard C
#include <stdio.h>

// sabnews
#include "sabnews/send_queue.hh"


#define ARRAY_LEN( a )  (sizeof a / sizeof a[0])

#define STR_LEN( s )  "" s, (sizeof s - 1)


namespace sabnews {


static const char* not_found_lines[] =
{
	"430 No Such Article Found (bad message-id)\r\n",
	"430 No Such Article Found (no file on disk)\r\n",
	"430 No Such Article Found (invalid start/size attributes)\r\n",
	"430 No Such Article Found (unreadable file)\r\n",
};

void send_greeting( send_queue& queue )
{
	queue.add( STR_LEN( "200 Welcome (SABNews)\r\n" ) );
	
	queue.flush();
}

void send_closing( send_queue& queue )
{
	fprintf( stderr, "Closing connection\n" );
	
	queue.add( STR_LEN( "205 Connection closing\r\n" ) );
	
	queue.flush();
}

void send_not_found( send_queue& queue, not_found_reason reason )
{
	if ( unsigned( reason ) >= ARRAY_LEN( not_found_lines ) )
	{
		reason = reason_unreadable;
	}
	
	queue.add( not_found_lines[ reason ] );
	
	queue.flush();
}

void queue_article_headers( send_queue&          queue,
                            const plus::string&  message_id,
                            const char*          file_base )
{
	queue.add( STR_LEN( "222 0 " ) );
	queue.add( message_id.data(), message_id.size() );
	queue.add( STR_LEN( "\r\n" ) );
	
	queue.add( STR_LEN( "Message-ID: " ) );
	queue.add( message_id.data(), message_id.size() );
	queue.add( STR_LEN( "\r\n" ) );
	
	queue.add( STR_LEN( "Subject: \"" ) );
	queue.add( file_base );
	queue.add( STR_LEN( "\"\r\n\r\n" ) );
}

}  // namespace sabnews
