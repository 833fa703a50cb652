/*
	sabnews/response.hh
	-------------------
*/

#ifndef SABNEWS_RESPONSE_HH
#define SABNEWS_RESPONSE_HH

// plus
#include "plus/string.hh"


namespace sabnews
{
	
	class send_queue;
	
	enum not_found_reason
	{
		reason_bad_message_id,
		reason_no_file,
		reason_invalid_range,
		reason_unreadable,
	};
	
	void send_greeting( send_queue& queue );
	void send_closing ( send_queue& queue );
	
	void send_not_found( send_queue& queue, not_found_reason reason );
	
	/*
		222 line, Message-ID and Subject headers, blank line.
	*/
	
	void queue_article_headers( send_queue&          queue,
	                            const plus::string&  message_id,
	                            const char*          file_base );
	
}

#endif
