/*
	sabnews/message_id.cc
	---------------------
*/

#include "sabnews/message_id.hh"

// Standard C
#include <stdio.h>
#include <string.h>


#define STR_LEN( s )  "" s, (sizeof s - 1)


namespace sabnews
{
	
	using std::size_t;
	
	
	static inline
	bool skip( const char*& p, const char* end, const char* s, size_t n )
	{
		if ( size_t( end - p ) < n  ||  memcmp( p, s, n ) != 0 )
		{
			return false;
		}
		
		p += n;
		
		return true;
	}
	
	// Values too large for 64 bits saturate, so they still fail the range check.
	
	static
	bool scan_decimal( const char*& p, const char* end, uint64_t& result )
	{
		const uint64_t max = uint64_t( -1 );
		
		const char* begin = p;
		
		uint64_t value = 0;
		
		while ( p < end  &&  *p >= '0'  &&  *p <= '9' )
		{
			const unsigned digit = *p++ - '0';
			
			value = value > (max - digit) / 10 ? max
			                                   : value * 10 + digit;
		}
		
		result = value;
		
		return p != begin;
	}
	
	bool parse_article_command( const char* line, size_t n, article_request& result )
	{
		const char* p   = line;
		const char* end = line + n;
		
		if ( n < 2  ||  end[ -2 ] != '\r'  ||  end[ -1 ] != '\n' )
		{
			return false;
		}
		
		end -= 2;
		
		if ( ! skip( p, end, STR_LEN( "ARTICLE " ) )  &&
		     ! skip( p, end, STR_LEN( "BODY "    ) ) )
		{
			return false;
		}
		
		const char* id = p;
		
		if ( ! skip( p, end, STR_LEN( "<file=" ) ) )
		{
			return false;
		}
		
		const char* file = p;
		
		while ( p < end  &&  *p != '|' )
		{
			if ( *p == '\r'  ||  *p == '\n' )
			{
				return false;
			}
			
			++p;
		}
		
		const char* file_end = p;
		
		const bool matched = skip( p, end, STR_LEN( "|part=" ) )
		                  && scan_decimal( p, end, result.part )
		                  && skip( p, end, STR_LEN( "|start=" ) )
		                  && scan_decimal( p, end, result.start )
		                  && skip( p, end, STR_LEN( "|size=" ) )
		                  && scan_decimal( p, end, result.size )
		                  && skip( p, end, STR_LEN( ">" ) )
		                  && p == end;
		
		if ( ! matched )
		{
			return false;
		}
		
		result.message_id.assign( id,   end      - id   );
		result.file      .assign( file, file_end - file );
		
		return true;
	}
	
	plus::var_string format_message_id( const char*  file,
	                                    uint64_t     part,
	                                    uint64_t     start,
	                                    uint64_t     size )
	{
		char numbers[ 96 ];
		
		int n = snprintf( numbers, sizeof numbers,
		                  "|part=%llu|start=%llu|size=%llu>",
		                  (unsigned long long) part,
		                  (unsigned long long) start,
		                  (unsigned long long) size );
		
		plus::var_string result;
		
		result.append( STR_LEN( "<file=" ) );
		result.append( file, strlen( file ) );
		result.append( numbers, n );
		
		return result;
	}
	
	const char* file_base_name( const char* path )
	{
		if ( const char* slash = strrchr( path, '/' ) )
		{
			path = slash + 1;
		}
		
		return path;
	}
	
}
