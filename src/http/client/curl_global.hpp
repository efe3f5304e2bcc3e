//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef TETHER_CURL_GLOBAL_HPP
#define TETHER_CURL_GLOBAL_HPP

namespace tether::http::client {

    // Must outlive every CurlEasy; construct once in main() before any request is dispatched.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace tether::http::client

#endif
