/*
	sabnews/session.hh
	------------------
*/

#ifndef SABNEWS_SESSION_HH
#define SABNEWS_SESSION_HH

// sabnews
#include "sabnews/send_queue.hh"


namespace sabnews
{
	
	/*
		One client connection.  Everything a command needs arrives on its
		line; the session itself only carries the output side.
	*/
	
	class session
	{
		private:
			send_queue  its_queue;
			bool        its_connected;
			
			// non-copyable
			session           ( const session& );
			session& operator=( const session& );
			
		public:
			explicit session( int send_fd )
			:
				its_queue( send_fd ),
				its_connected( false )
			{
			}
			
			send_queue& queue()  { return its_queue; }
			
			bool connected() const  { return its_connected; }
			
			void connect();
			void disconnect();
	};
	
}

#endif
