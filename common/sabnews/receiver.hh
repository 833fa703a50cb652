/*
	sabnews/receiver.hh
	-------------------
*/

#ifndef SABNEWS_RECEIVER_HH
#define SABNEWS_RECEIVER_HH

// Standard C++
#include <cstddef>

// plus
#include "plus/var_string.hh"


namespace sabnews
{
	
	/*
		The handler sees each complete line including its terminator.
		It returns 0 to keep going, a positive value to end the session
		normally, or a negative errno.
	*/
	
	typedef int (*line_handler_function)( void*, const char* line, std::size_t n );
	
	class line_receiver
	{
		private:
			plus::var_string  its_buffer;
			
			line_handler_function  its_handler;
			void*                  its_context;
		
		public:
			line_receiver( line_handler_function handler, void* context );
			
			int recv_bytes( const char* buffer, std::size_t n );
			
			std::size_t pending() const  { return its_buffer.size(); }
	};
	
}

#endif
