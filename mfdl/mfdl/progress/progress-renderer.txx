#include <sstream>
#include <iomanip>
#include <utility>
#include <algorithm>
#include <system_error>

namespace mfdl
{
  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_row (const row_type& r)
  {
    using namespace ftxui;

    const transfer_snapshot& t (r.transfer);

    std::ostringstream amount;
    amount << format_type::size (t.received);
    if (t.known ())
      amount << " / " << format_type::size (t.expected);

    // Until the size is known there is nothing to fill the gauge with.
    //
    Element g (gauge (static_cast<float> (t.fraction ())));
    if (!t.known () && t.phase == progress_phase::transferring)
      g = g | dim;

    Element st;

    if (!r.status.empty ())
    {
      st = text (r.status);

      if (t.phase == progress_phase::failed)
        st = st | color (Color::Red);
      else if (t.phase == progress_phase::finished)
        st = st | color (Color::Green);
    }
    else if (auto d = t.remaining ())
      st = text (format_type::duration (*d));
    else
      st = text ("--");

    std::ostringstream pct;
    pct << std::setw (3) << static_cast<int> (t.fraction () * 100) << '%';

    return hbox ({
      text (r.label) | size (WIDTH, EQUAL, label_width),
      text (" "),
      text (pct.str ()),
      text (" "),
      g | size (WIDTH, EQUAL, gauge_width),
      text (" "),
      text (amount.str ()) | size (WIDTH, EQUAL, 22),
      text (format_type::rate (t.rate)) | size (WIDTH, EQUAL, 12),
      st | size (WIDTH, EQUAL, 8)
    });
  }

  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_overall (const view_type& v)
  {
    using namespace ftxui;

    const transfer_snapshot& t (v.overall);

    std::ostringstream l;
    l << '[' << v.files_done << '/' << v.files_total << "] "
      << format_type::size (t.received) << " of "
      << format_type::size (t.expected);

    std::ostringstream r;
    r << format_type::rate (t.rate);
    if (auto d = t.remaining ())
      r << "  eta " << format_type::duration (*d);

    return hbox ({
      text (l.str ()) | bold,
      text (" "),
      gauge (static_cast<float> (t.fraction ())) | flex,
      text (" "),
      text (r.str ())
    });
  }

  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_notes (const std::vector<string_type>& ns)
  {
    using namespace ftxui;

    Elements es;
    for (const string_type& n: ns)
      es.push_back (paragraph (n) | dim);

    return vbox (std::move (es));
  }

  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render (const view_type& v, int height)
  {
    using namespace ftxui;

    // Summary and its separator, plus the notes.
    //
    int reserved (2 + static_cast<int> (v.notes.size ()));
    std::size_t fit (static_cast<std::size_t> (std::max (0, height - reserved)));

    Elements rows;
    std::size_t n (v.rows.size ());

    // Leave room for the overflow line if not everything fits.
    //
    std::size_t shown (n <= fit ? n : (fit != 0 ? fit - 1 : 0));

    for (std::size_t i (0); i != shown; ++i)
      rows.push_back (render_row (v.rows[i]));

    if (shown != n)
    {
      std::ostringstream o;
      o << "... and " << n - shown << " more";
      rows.push_back (text (o.str ()) | dim);
    }

    return vbox ({
      vbox (std::move (rows)),
      render_notes (v.notes),
      separator (),
      render_overall (v)
    });
  }

  template <typename T>
  basic_progress_renderer<T>::
  basic_progress_renderer ()
    : screen_ (ftxui::ScreenInteractive::FitComponent ())
  {
  }

  template <typename T>
  basic_progress_renderer<T>::
  ~basic_progress_renderer ()
  {
    stop ();
  }

  template <typename T>
  void basic_progress_renderer<T>::
  start ()
  {
    if (running_.exchange (true, std::memory_order_relaxed))
      return;

    component_ = ftxui::Renderer ([this]
    {
      std::lock_guard<std::mutex> l (mutex_);
      return traits_type::render (view_, screen_.dimy ());
    });

    try
    {
      ui_thread_ = std::jthread ([this]
      {
        screen_.Loop (component_);
      });
    }
    catch (const std::system_error&)
    {
      running_.store (false, std::memory_order_relaxed);
      throw;
    }
  }

  template <typename T>
  void basic_progress_renderer<T>::
  stop ()
  {
    if (running_.exchange (false, std::memory_order_relaxed))
      screen_.Exit ();

    if (ui_thread_.joinable ())
      ui_thread_.join ();
  }

  template <typename T>
  void basic_progress_renderer<T>::
  show (view_type v)
  {
    {
      std::lock_guard<std::mutex> l (mutex_);
      view_ = std::move (v);
    }

    if (running ())
      screen_.Post (ftxui::Event::Custom);
  }
}
