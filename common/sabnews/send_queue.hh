/*
	sabnews/send_queue.hh
	---------------------
*/

#ifndef SABNEWS_SENDQUEUE_HH
#define SABNEWS_SENDQUEUE_HH

// POSIX
#include <sys/types.h>

// Standard C
#include <string.h>


namespace sabnews
{
	
	class buffer
	{
		private:
			static const size_t buffer_length = 8192;
			
			char its_buffer[ buffer_length ];
			
			size_t  its_mark;
		
		public:
			static size_t capacity() { return buffer_length; }
			
			buffer() : its_mark()
			{
			}
			
			const char* data() const  { return its_buffer; }
			size_t      size() const  { return its_mark;   }
			
			size_t freespace() const  { return capacity() - size(); }
			
			void append_UNCHECKED( const void* data, size_t n );
			
			void clear()  { its_mark = 0; }
	};
	
	/*
		Output side of a connection.  Small writes (status lines, one yEnc
		byte at a time) are coalesced; nothing reaches the descriptor until
		the buffer fills or flush() is called.  Write failures are thrown as
		poseven::errno_t.
	*/
	
	class send_queue
	{
		private:
			buffer  its_buffer;
			int     its_fd;
			
			// non-copyable
			send_queue           ( const send_queue& );
			send_queue& operator=( const send_queue& );
		
		public:
			send_queue( int fd ) : its_fd( fd )
			{
			}
			
			int fd() const  { return its_fd; }
			
			void flush();
			
			void add( const void* data, size_t n );
			
			void add( const char* s )
			{
				add( s, strlen( s ) );
			}
	};
	
}

#endif
