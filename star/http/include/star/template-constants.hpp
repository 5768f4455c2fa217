#pragma once

#include <string_view>

namespace star {

// Built-in error page, used when no template file is configured. Keys: title, message.
inline constexpr std::string_view kDefaultErrorPageTemplate =
    R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>{{ title }}</title>
<style>
body{margin:0;font-family:-apple-system,BlinkMacSystemFont,"Segoe UI",sans-serif;background:#f4f5fb;color:#1f2540;display:flex;min-height:100vh;align-items:center;justify-content:center;}
.card{background:#fff;border-radius:16px;box-shadow:0 12px 40px rgba(31,37,64,.12);padding:2.5rem 3rem;text-align:center;max-width:520px;}
h1{font-size:2rem;margin:0 0 1rem;}
p{margin:0;color:#5f5b76;}
</style>
</head>
<body>
<div class="card">
<h1>{{ title }}</h1>
<p>{{ message }}</p>
</div>
</body>
</html>
)";

inline constexpr std::string_view kNotFoundTitle = "404 Not Found";
inline constexpr std::string_view kNotFoundMessage = "Page Not Found";
inline constexpr std::string_view kInternalServerErrorTitle = "500 Internal Server Error";

}  // namespace star
