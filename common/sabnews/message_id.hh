/*
	sabnews/message_id.hh
	---------------------
*/

#ifndef SABNEWS_MESSAGEID_HH
#define SABNEWS_MESSAGEID_HH

// Standard C
#include <stdint.h>

// Standard C++
#include <cstddef>

// plus
#include "plus/string.hh"
#include "plus/var_string.hh"


namespace sabnews
{
	
	/*
		An article is addressed by a synthetic message-id naming a byte
		range of a file:
		
			<file=folder/name.bin|part=4|start=5000|size=5000>
	*/
	
	struct article_request
	{
		plus::string message_id;  // including the angle brackets
		plus::string file;
		
		uint64_t  part;
		uint64_t  start;
		uint64_t  size;
		
		article_request() : part(), start(), size()
		{
		}
	};
	
	/*
		Parses a whole command line, "ARTICLE <...>\r\n" or "BODY <...>\r\n".
		Returns false if the line doesn't match exactly; result is unspecified
		in that case.  Numbers too large for 64 bits become UINT64_MAX.
	*/
	
	bool parse_article_command( const char* line, std::size_t n, article_request& result );
	
	plus::var_string format_message_id( const char*  file,
	                                    uint64_t     part,
	                                    uint64_t     start,
	                                    uint64_t     size );
	
	const char* file_base_name( const char* path );
	
}

#endif
