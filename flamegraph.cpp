/**************************************************************************
 *
 * Copyright 2011-2014 Jose Fonseca
 * All Rights Reserved.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 *
 **************************************************************************/


#include <stdio.h>
#include <stdarg.h>
#include <string.h>

#include <algorithm>
#include <string>
#include <vector>

#include "heapsnap.h"


namespace heapsnap {


FlamegraphOptions::FlamegraphOptions() :
   title("Heap Profile"),
   count_name("bytes"),
   palette(PALETTE_MEM),
   measure(MEASURE_ALLOC_SPACE),
   width(1200),
   frame_height(16),
   font_size(12),
   min_width(0.1)
{
}


namespace {


struct Node
{
   std::string name;
   int64_t value;
   std::vector<Node> children;

   explicit Node(const std::string &n) :
      name(n),
      value(0)
   {
   }
};


bool
_by_name(const Node &a, const Node &b)
{
   return a.name < b.name;
}


Node *
_child(Node &parent, const std::string &name)
{
   for (size_t i = 0; i < parent.children.size(); ++i) {
      if (parent.children[i].name == name) {
         return &parent.children[i];
      }
   }
   parent.children.push_back(Node(name));
   return &parent.children.back();
}


unsigned
_depth(const Node &node)
{
   unsigned depth = 0;
   for (size_t i = 0; i < node.children.size(); ++i) {
      depth = std::max(depth, 1 + _depth(node.children[i]));
   }
   return depth;
}


void
_sort(Node &node)
{
   std::sort(node.children.begin(), node.children.end(), _by_name);
   for (size_t i = 0; i < node.children.size(); ++i) {
      _sort(node.children[i]);
   }
}


/**
 * Deterministic 0..1 value from a frame name, as flamegraph.pl's --hash does,
 * so a function keeps its colour across graphs.
 */
double
_namehash(const std::string &name, bool reverse)
{
   double vector = 0;
   double weight = 1;
   double max = 1;
   unsigned mod = 10;

   size_t n = name.size();
   for (size_t i = 0; i < n; ++i) {
      unsigned char c = reverse ? name[n - 1 - i] : name[i];
      unsigned v = c % mod;
      vector += (v / (double)(mod++ - 1)) * weight;
      max += weight;
      weight *= 0.70;
      if (mod > 12) {
         break;
      }
   }

   return 1 - vector / max;
}


std::string
_color(Palette palette, const std::string &name)
{
   double v1 = _namehash(name, false);
   double v2 = _namehash(name, true);

   unsigned r, g, b;
   switch (palette) {
   case PALETTE_HOT:
      r = 205 + (unsigned)(50 * v2);
      g = 0 + (unsigned)(230 * v1);
      b = 0 + (unsigned)(55 * v2);
      break;
   case PALETTE_MEM:
   default:
      r = 0;
      g = 190 + (unsigned)(50 * v2);
      b = 0 + (unsigned)(210 * v1);
      break;
   }

   char buf[32];
   snprintf(buf, sizeof buf, "rgb(%u,%u,%u)", r, g, b);
   return buf;
}


std::string
_escape(const std::string &s)
{
   std::string out;
   out.reserve(s.size());
   for (size_t i = 0; i < s.size(); ++i) {
      switch (s[i]) {
      case '&':  out += "&amp;"; break;
      case '<':  out += "&lt;"; break;
      case '>':  out += "&gt;"; break;
      case '"':  out += "&quot;"; break;
      default:   out += s[i]; break;
      }
   }
   return out;
}


__attribute__ ((format (printf, 2, 3)))
void
_printf(ReportSink &sink, const char *format, ...)
{
   char buf[1024];
   va_list ap;
   va_start(ap, format);
   int len = vsnprintf(buf, sizeof buf, format, ap);
   va_end(ap);
   if (len < 0) {
      return;
   }
   sink.write(buf, std::min((size_t)len, sizeof buf - 1));
}


inline void
_puts(ReportSink &sink, const std::string &s)
{
   sink.write(s.data(), s.size());
}


class Renderer
{
   ReportSink &_sink;
   const FlamegraphOptions &_options;
   double _xpad;
   double _ypad2;
   double _width_per_count;
   unsigned _image_height;
   int64_t _total;

public:
   Renderer(ReportSink &sink, const FlamegraphOptions &options) :
      _sink(sink),
      _options(options),
      _xpad(10),
      _ypad2(options.font_size * 2 + 10),
      _width_per_count(0),
      _image_height(0),
      _total(0)
   {
   }

   void
   render(const Node &root) {
      unsigned ypad1 = _options.font_size * 3;
      unsigned depth = _depth(root);
      _image_height = (depth + 1) * _options.frame_height + ypad1 + (unsigned)_ypad2;
      _total = root.value;

      _header();

      if (_total > 0) {
         _width_per_count = (_options.width - 2 * _xpad) / (double)_total;
         _frame(root, 0, 0);
      } else {
         _printf(_sink, "<text text-anchor=\"middle\" x=\"%.1f\" y=\"%u\">No allocations sampled</text>\n",
                 _options.width / 2.0, ypad1 + _options.frame_height);
      }

      _puts(_sink, "</svg>\n");
   }

private:
   void
   _header(void) {
      const char *bgcolor2 = _options.palette == PALETTE_MEM ? "#e0e0ff" : "#eeeeb0";

      _puts(_sink,
            "<?xml version=\"1.0\" standalone=\"no\"?>\n"
            "<!DOCTYPE svg PUBLIC \"-//W3C//DTD SVG 1.1//EN\" "
            "\"http://www.w3.org/Graphics/SVG/1.1/DTD/svg11.dtd\">\n");
      _printf(_sink,
              "<svg version=\"1.1\" width=\"%u\" height=\"%u\" viewBox=\"0 0 %u %u\" "
              "xmlns=\"http://www.w3.org/2000/svg\" xmlns:xlink=\"http://www.w3.org/1999/xlink\">\n",
              _options.width, _image_height, _options.width, _image_height);
      _printf(_sink,
              "<defs>\n"
              "  <linearGradient id=\"background\" y1=\"0\" y2=\"1\" x1=\"0\" x2=\"0\">\n"
              "    <stop stop-color=\"#eeeeee\" offset=\"5%%\"/>\n"
              "    <stop stop-color=\"%s\" offset=\"95%%\"/>\n"
              "  </linearGradient>\n"
              "</defs>\n",
              bgcolor2);
      _printf(_sink,
              "<style type=\"text/css\">\n"
              "  text { font-family:Verdana; font-size:%upx; fill:rgb(0,0,0); }\n"
              "  g:hover rect { stroke:black; stroke-width:0.5; cursor:pointer; }\n"
              "</style>\n",
              _options.font_size);
      _printf(_sink,
              "<rect x=\"0.0\" y=\"0\" width=\"%u\" height=\"%u\" fill=\"url(#background)\"/>\n",
              _options.width, _image_height);
      _printf(_sink,
              "<text text-anchor=\"middle\" x=\"%.1f\" y=\"%u\" font-size=\"%u\">",
              _options.width / 2.0, _options.font_size * 2, _options.font_size + 5);
      _puts(_sink, _escape(_options.title));
      _puts(_sink, "</text>\n");
   }

   void
   _frame(const Node &node, unsigned depth, int64_t start) {
      double x1 = _xpad + start * _width_per_count;
      double x2 = _xpad + (start + node.value) * _width_per_count;
      double width = x2 - x1;
      if (width < _options.min_width) {
         return;
      }

      double y1 = _image_height - _ypad2 - (depth + 1) * _options.frame_height + 1;
      double pct = 100.0 * node.value / _total;
      const std::string name = depth ? node.name : std::string("all");
      const std::string escaped = _escape(name);

      _puts(_sink, "<g>\n<title>");
      _puts(_sink, escaped);
      _printf(_sink, " (%lld %s, %.2f%%)</title>\n",
              (long long)node.value, _escape(_options.count_name).c_str(), pct);
      _printf(_sink,
              "<rect x=\"%.1f\" y=\"%.1f\" width=\"%.1f\" height=\"%.1f\" fill=\"%s\" rx=\"2\" ry=\"2\"/>\n",
              x1, y1, width, (double)_options.frame_height - 1,
              _color(_options.palette, name).c_str());

      // Fit the label, or leave it out.
      size_t chars = (size_t)(width / (_options.font_size * 0.59));
      if (chars >= 3) {
         std::string label = name;
         if (label.size() > chars) {
            label = label.substr(0, chars - 2) + "..";
         }
         _printf(_sink, "<text x=\"%.2f\" y=\"%.1f\">", x1 + 3, y1 + _options.frame_height - 5);
         _puts(_sink, _escape(label));
         _puts(_sink, "</text>\n");
      }

      _puts(_sink, "</g>\n");

      int64_t child_start = start;
      for (size_t i = 0; i < node.children.size(); ++i) {
         _frame(node.children[i], depth + 1, child_start);
         child_start += node.children[i].value;
      }
   }
};


} /* anonymous namespace */


void
Report::flamegraph(ReportSink &sink, const FlamegraphOptions &options) const
{
   Node root("");

   for (size_t i = 0; i < _entries.size(); ++i) {
      const Entry &entry = _entries[i];
      int64_t value = options.measure == MEASURE_INUSE_SPACE
                    ? entry.counts.in_use_bytes()
                    : entry.counts.alloc_bytes;
      if (value <= 0) {
         continue;
      }

      // Stacks with the same frame names merge, outermost frame at the root.
      root.value += value;
      Node *node = &root;
      for (size_t j = entry.frames.size(); j-- > 0; ) {
         node = _child(*node, entry.frames[j].name);
         node->value += value;
      }
   }

   _sort(root);

   Renderer renderer(sink, options);
   renderer.render(root);

   sink.flush();
}


} /* namespace heapsnap */


// vim:set sw=3 ts=3 et:
